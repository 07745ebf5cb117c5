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

#include <QString>                      // for QString
#include <QStringView>                  // for QStringView
#include <Qt>                           // for CaseInsensitive
#include <QXmlStreamAttribute>          // for QXmlStreamAttribute
#include <QXmlStreamAttributes>         // for QXmlStreamAttributes

#include "src/core/xmltag.h"

namespace gpxstream
{

/*
 * xml_tag utilities
 */

// Depth first, this tag excluded.
const XmlTag* XmlTag::xml_findfirst(QStringView name) const
{
  for (const auto& child : children) {
    if (child.tagname.compare(name, Qt::CaseInsensitive) == 0) {
      return &child;
    }
    if (const XmlTag* found = child.xml_findfirst(name)) {
      return found;
    }
  }
  return nullptr;
}

QString XmlTag::xml_attribute(QStringView attrname) const
{
  for (const auto& attribute : this->attributes) {
    if (attribute.qualifiedName().compare(attrname, Qt::CaseInsensitive) == 0) {
      return attribute.value().toString();
    }
  }
  return QString();
}

// Number of elements in this subtree, this one included.
int XmlTag::count() const
{
  int n = 1;
  for (const auto& child : children) {
    n += child.count();
  }
  return n;
}

bool operator==(const XmlTag& lhs, const XmlTag& rhs)
{
  return lhs.tagname == rhs.tagname &&
         lhs.cdata == rhs.cdata &&
         lhs.parentcdata == rhs.parentcdata &&
         lhs.attributes == rhs.attributes &&
         lhs.children == rhs.children;
}

} // namespace gpxstream
