/*
    A peekable stream of XML events on top of QXmlStreamReader.

    Copyright (C) 2002-2015 Robert Lipe, gpsbabel.org

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

 */

#include "xmlevents.h"

#include <optional>                         // for optional, nullopt
#include <utility>                          // for move

#include <QByteArray>                       // for QByteArray
#include <QIODevice>                        // for QIODevice
#include <QString>                          // for QString
#include <QXmlStreamNamespaceDeclaration>   // for QXmlStreamNamespaceDeclaration
#include <QXmlStreamNamespaceDeclarations>  // for QXmlStreamNamespaceDeclarations
#include <QXmlStreamReader>                 // for QXmlStreamReader, QXmlStreamReader::Characters, QXmlStreamReader::EndDocument, QXmlStreamReader::EndElement, QXmlStreamReader::Invalid, QXmlStreamReader::StartElement

#include "src/core/error.h"                 // for Error


namespace gpxstream
{

XmlEventReader::XmlEventReader(QIODevice* device) : reader(device)
{
}

XmlEventReader::XmlEventReader(const QByteArray& data) : reader(data)
{
}

const XmlEvent* XmlEventReader::peek()
{
  if (!peeked) {
    lookahead = fetch();
    peeked = true;
  }
  return lookahead ? &*lookahead : nullptr;
}

std::optional<XmlEvent> XmlEventReader::next()
{
  if (!peeked) {
    return fetch();
  }
  peeked = false;
  std::optional<XmlEvent> event = std::move(lookahead);
  lookahead.reset();
  return event;
}

void XmlEventReader::verify_end_of_document()
{
  const XmlEvent* event = peek();
  if (event == nullptr) {
    if (reader.error() == QXmlStreamReader::PrematureEndOfDocumentError) {
      throw Error::xml(reader.errorString(), reader.lineNumber(), reader.columnNumber());
    }
    return;
  }
  if (event->isText()) {
    throw Error::unexpectedText(event->text, QStringLiteral("end of document"));
  }
  throw Error::invalidChildElement(event->qualifiedName, QStringLiteral("document"));
}

std::optional<XmlEvent> XmlEventReader::fetch()
{
  for (bool atEnd = false; !reader.atEnd() && !atEnd;) {
    reader.readNext();
    switch (reader.tokenType()) {
    case QXmlStreamReader::StartElement: {
      XmlEvent event;
      event.type = XmlEvent::Type::StartElement;
      event.name = reader.name().toString();
      event.qualifiedName = reader.qualifiedName().toString();
      event.attributes = reader.attributes();
      const QXmlStreamNamespaceDeclarations ns = reader.namespaceDeclarations();
      for (const auto& n : ns) {
        QString prefix = n.prefix().toString().prepend(n.prefix().isEmpty()? "xmlns" : "xmlns:");
        event.namespaceDeclarations.append(prefix, n.namespaceUri().toString());
      }
      return event;
    }

    case QXmlStreamReader::EndElement: {
      XmlEvent event;
      event.type = XmlEvent::Type::EndElement;
      event.name = reader.name().toString();
      event.qualifiedName = reader.qualifiedName().toString();
      return event;
    }

    case QXmlStreamReader::Characters:
      // Indentation and line endings between elements carry nothing.
      if (reader.isWhitespace() && !reader.isCDATA()) {
        break;
      }
      {
        XmlEvent event;
        event.type = XmlEvent::Type::Text;
        event.text = reader.text().toString();
        return event;
      }

    case QXmlStreamReader::EndDocument:
    case QXmlStreamReader::Invalid:
      atEnd = true;
      break;

    default:
      break;
    }
  }

  if (reader.hasError() && reader.error() != QXmlStreamReader::PrematureEndOfDocumentError) {
    throw Error::xml(reader.errorString(), reader.lineNumber(), reader.columnNumber());
  }
  return std::nullopt;
}

} // namespace gpxstream
