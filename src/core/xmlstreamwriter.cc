/*
    Copyright (C) 2013 Robert Lipe, gpsbabel.org

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

#include "src/core/xmlstreamwriter.h"

#include <optional>                 // for optional

#include <QString>                  // for QString
#include <QXmlStreamAttribute>      // for QXmlStreamAttribute
#include <QXmlStreamWriter>         // for QXmlStreamWriter

#include "src/core/xmltag.h"        // for XmlTag

// We rely on Qt to strip out characters that are illegal in xml.  These can
// creep into our strings from extension content that escaped them.
// https://bugreports.qt.io/browse/QTBUG-63150


namespace gpxstream
{

// Don't emit the element if there's nothing interesting in it.
void XmlStreamWriter::writeOptionalTextElement(const QString& qualifiedName, const QString& text)
{
  if (!text.isEmpty()) {
    QXmlStreamWriter::writeTextElement(qualifiedName, text);
  }
}

void XmlStreamWriter::writeOptionalTextElement(const QString& qualifiedName, const std::optional<QString>& text)
{
  if (text.has_value()) {
    writeOptionalTextElement(qualifiedName, *text);
  }
}

/*
 * Write an element we passed through from the input, with its attributes,
 * text and children, in the order we read them.
 */
void XmlStreamWriter::writeXmlTag(const XmlTag& tag)
{
  writeStartElement(tag.tagname);
  for (const auto& attribute : tag.attributes) {
    writeAttribute(attribute.qualifiedName().toString(), attribute.value().toString());
  }
  writeXmlTagChildren(tag);
  writeEndElement();
}

void XmlStreamWriter::writeXmlTagChildren(const XmlTag& tag)
{
  if (!tag.cdata.isEmpty()) {
    writeCharacters(tag.cdata);
  }
  for (const auto& child : tag.children) {
    writeXmlTag(child);
    if (!child.parentcdata.isEmpty()) {
      writeCharacters(child.parentcdata);
    }
  }
}

} // namespace gpxstream
