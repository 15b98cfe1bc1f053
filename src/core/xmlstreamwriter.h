/*
    Copyright (C) 2013 Robert Lipe, gpsbabel.org
    Copyright (C) 2026 The RideLog Authors

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

#ifndef XMLSTREAMWRITER_H
#define XMLSTREAMWRITER_H

#include <utility>           // for move

#include <QList>             // for QList
#include <QString>           // for QString
#include <QXmlStreamWriter>  // for QXmlStreamWriter

namespace ridelog
{

/*
 * QXmlStreamWriter that can hold back an element until it is known to
 * have content, so optional containers such as <extensions> are never
 * written empty.
 */
class XmlStreamWriter : public QXmlStreamWriter
{
public:
  using QXmlStreamWriter::QXmlStreamWriter;

  /* Member Functions */

  void stackOptionalStartElement(const QString& name);
  void stackStartElement(const QString& name);
  void stackTextElement(const QString& name, const QString& text);
  void stackOptionalTextElement(const QString& name, const QString& text);
  void stackEndElement();

  void writeOptionalTextElement(const QString& qualifiedName, const QString& text);

private:
  /* Types */

  enum class xml_wrt_cmd_t {
    start_element,
    text_element,
    end_element
  };

  struct xml_command {
    explicit xml_command(xml_wrt_cmd_t t,
                         QString n = QString(),
                         QString v = QString())
      : type(t), name(std::move(n)), value(std::move(v)) {}

    xml_wrt_cmd_t type;
    QString name;
    QString value;
  };

  // Commands held back for one optional element and its children.
  struct pending_element_t {
    QList<xml_command> commands;
    int text_count{0};
    int depth{0};
  };

  /* Member Functions */

  pending_element_t& activeElement();
  void replay(const pending_element_t& element);

  /* Data Members */

  QList<pending_element_t> pending;
};

} // namespace ridelog

#endif // XMLSTREAMWRITER_H
