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
#ifndef XMLEVENTS_H_INCLUDED_
#define XMLEVENTS_H_INCLUDED_

#include <optional>                    // for optional

#include <QByteArray>                  // for QByteArray
#include <QIODevice>                   // for QIODevice
#include <QString>                     // for QString
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QXmlStreamReader>            // for QXmlStreamReader

namespace gpxstream
{

struct XmlEvent {
  enum class Type {
    StartElement,
    EndElement,
    Text
  };

  Type type{Type::Text};
  QString name;                        // local name, empty for Text
  QString qualifiedName;               // prefix:name as written
  QXmlStreamAttributes attributes;     // StartElement only
  // xmlns and xmlns:prefix declarations made on this element,
  // as attributes.  StartElement only.
  QXmlStreamAttributes namespaceDeclarations;
  QString text;                        // Text only

  bool isStartElement() const
  {
    return type == Type::StartElement;
  }
  bool isEndElement() const
  {
    return type == Type::EndElement;
  }
  bool isText() const
  {
    return type == Type::Text;
  }
};

/*
 * Reduces the QXmlStreamReader token stream to element opens, element
 * closes and text.  Comments, processing instructions, the DTD and white
 * space between elements are dropped.  CDATA sections and entity
 * references arrive as text.
 *
 * A premature end of the document is reported as the end of the stream,
 * so that the consumer that was waiting for its closing tag can say so.
 * Any other tokenizer failure throws gpxstream::Error of kind Xml.
 */
class XmlEventReader
{
public:
  explicit XmlEventReader(QIODevice* device);
  explicit XmlEventReader(const QByteArray& data);

  XmlEventReader(const XmlEventReader&) = delete;
  XmlEventReader& operator=(const XmlEventReader&) = delete;

  // nullptr at the end of the stream.
  const XmlEvent* peek();
  std::optional<XmlEvent> next();

  // Call once the root element is closed.  Throws if anything but the
  // end of the document follows, including the start of something
  // that was cut short.
  void verify_end_of_document();

private:
  std::optional<XmlEvent> fetch();

  QXmlStreamReader reader;
  std::optional<XmlEvent> lookahead;
  bool peeked{false};
};

} // namespace gpxstream

#endif // XMLEVENTS_H_INCLUDED_
