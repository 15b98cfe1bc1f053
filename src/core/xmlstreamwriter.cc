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

#include "src/core/xmlstreamwriter.h"

#include <stdexcept>         // for logic_error

#include <QString>           // for QString
#include <QXmlStreamWriter>  // for QXmlStreamWriter

namespace ridelog
{

XmlStreamWriter::pending_element_t& XmlStreamWriter::activeElement()
{
  if (pending.isEmpty()) {
    throw std::logic_error("xmlstreamwriter: stack*() used without stackOptionalStartElement().");
  }
  return pending.last();
}

void XmlStreamWriter::replay(const pending_element_t& element)
{
  for (const auto& command : element.commands) {
    switch (command.type) {
    case xml_wrt_cmd_t::start_element:
      QXmlStreamWriter::writeStartElement(command.name);
      break;
    case xml_wrt_cmd_t::text_element:
      QXmlStreamWriter::writeTextElement(command.name, command.value);
      break;
    case xml_wrt_cmd_t::end_element:
      QXmlStreamWriter::writeEndElement();
      break;
    }
  }
}

/*
 * Start an element that will be written if and only if some text element
 * ends up inside it.  Must be paired with stackEndElement(), and nothing
 * may be written directly until the outermost optional element is closed.
 */
void XmlStreamWriter::stackOptionalStartElement(const QString& name)
{
  pending.append(pending_element_t());
  stackStartElement(name);
}

void XmlStreamWriter::stackStartElement(const QString& name)
{
  pending_element_t& element = activeElement();
  element.commands.append(xml_command(xml_wrt_cmd_t::start_element, name));
  ++element.depth;
}

void XmlStreamWriter::stackTextElement(const QString& name, const QString& text)
{
  pending_element_t& element = activeElement();
  element.commands.append(xml_command(xml_wrt_cmd_t::text_element, name, text));
  ++element.text_count;
}

void XmlStreamWriter::stackOptionalTextElement(const QString& name, const QString& text)
{
  if (!text.isEmpty()) {
    stackTextElement(name, text);
  }
}

void XmlStreamWriter::stackEndElement()
{
  pending_element_t& element = activeElement();
  element.commands.append(xml_command(xml_wrt_cmd_t::end_element));
  if (--element.depth > 0) {
    return;
  }

  // The optional element is complete.  Empty ones are dropped.
  const pending_element_t completed = pending.takeLast();
  if (completed.text_count == 0) {
    return;
  }
  if (!pending.isEmpty()) {
    pending_element_t& parent = pending.last();
    parent.commands.append(completed.commands);
    parent.text_count += completed.text_count;
  } else {
    replay(completed);
  }
}

// Don't emit the element if there's nothing interesting in it.
void XmlStreamWriter::writeOptionalTextElement(const QString& qualifiedName, const QString& text)
{
  if (!text.isEmpty()) {
    QXmlStreamWriter::writeTextElement(qualifiedName, text);
  }
}

} // namespace ridelog
