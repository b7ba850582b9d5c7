// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef JSONEVENT_XML_H
#define JSONEVENT_XML_H

#include "parser.h"
#include <ostream>
#include <string>
#include <vector>

namespace jsonevent
{

// Renders the events of a Parser as an XML document. Nothing is buffered beyond the current
// event: each call to next() produces the text for at most one event (the first call produces
// the header).
//
// An object member becomes an element named after its key, and an array element becomes an
// element named XmlOptions::list_item. The top-level value is rendered as the root element.
class XmlRenderer final
{
public:
    explicit XmlRenderer(Parser &parser, const XmlOptions &options = {});

    // Produce the next piece of the document. Returns false once the closing root tag has been
    // produced and the parser has reached the end of input.
    [[nodiscard]] auto next(std::string &fragment) -> Result<bool>;

private:
    [[nodiscard]] auto render(const Event &event, std::string &out) -> bool;
    auto render_scalar(const Event &event, const std::string &tag, std::string &out) const -> void;
    auto indent(std::string &out) const -> void;
    auto newline(std::string &out) const -> void;
    [[nodiscard]] auto child_tag() const -> std::string;

    XmlOptions m_options;
    std::vector<bool> m_is_object;
    std::vector<std::string> m_tags;
    std::string m_key;
    Parser *m_parser;
    bool m_started = false;
    bool m_finished = false;
};

// Convert a parser's whole output to XML, writing it to `os`.
[[nodiscard]] auto render_xml(Source &source, const Options &options, const XmlOptions &xml_options,
                              std::ostream &os) -> Status;

// Check if `name` can be used as an XML element name.
[[nodiscard]] auto is_xml_name(const Slice &name) -> bool;

// Turn an arbitrary object key into an XML element name. Invalid characters are replaced with
// '_', and names that cannot start an element get a '_' prefix.
[[nodiscard]] auto to_xml_name(const Slice &key) -> std::string;

// Wrap `value` in a CDATA section if it contains any XML markup characters. A "]]>" inside the
// value is split across two sections. Control characters that XML 1.0 does not allow (anything
// below 0x20 except tab, LF and CR) are replaced with U+FFFD.
[[nodiscard]] auto escape_xml_value(const Slice &value) -> std::string;

} // namespace jsonevent

#endif // JSONEVENT_XML_H
