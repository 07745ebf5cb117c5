/*
    Copyright (C) 2002-2014 Robert Lipe, robertlipe+source@gpsbabel.org

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
#ifndef SRC_CORE_XMLTAG_H
#define SRC_CORE_XMLTAG_H

#include <vector>                                  // for vector

#include <QString>                                 // for QString
#include <QStringView>                             // for QStringView
#include <QXmlStreamAttributes>                    // for QXmlStreamAttributes

namespace gpxstream
{

/*
 * An element we carry along without understanding it, i.e. the
 * contents of an <extensions> block.  cdata is the text directly inside
 * the element before its first child, parentcdata the text that follows
 * the element inside its parent.  Both are trimmed.
 */
class XmlTag
{
public:

  /* Member Functions */

  const XmlTag* xml_findfirst(QStringView name) const;
  QString xml_attribute(QStringView attrname) const;
  int count() const;

  friend bool operator==(const XmlTag& lhs, const XmlTag& rhs);
  friend bool operator!=(const XmlTag& lhs, const XmlTag& rhs)
  {
    return !(lhs == rhs);
  }

  /* Data Members */

  QString tagname;
  QString cdata;
  QString parentcdata;
  QXmlStreamAttributes attributes;
  std::vector<XmlTag> children;
};

} // namespace gpxstream

#endif // SRC_CORE_XMLTAG_H
