// Copyright (c) 2022, The jsonevent Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "jsonevent/xml.h"
#include "utils/expect.h"
#include <string_view>

namespace jsonevent
{

namespace
{

constexpr auto kIndentWidth = 4;

// U+FFFD REPLACEMENT CHARACTER, encoded as UTF-8.
constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

// XML 1.0 has no way to represent C0 control characters other than tab, LF and CR, not even
// as character references.
auto is_forbidden_char(char c) -> bool
{
    return static_cast<unsigned char>(c) < 0x20 && c != '\t' && c != '\n' && c != '\r';
}

// Bytes >= 0x80 belong to multibyte UTF-8 sequences. They are accepted as-is, since most
// non-ASCII letters are valid in XML names.
auto is_name_start(char c) -> bool
{
    const auto u = static_cast<unsigned char>(c);
    return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || c == '_' || u >= 0x80;
}

auto is_name_char(char c) -> bool
{
    return is_name_start(c) || ('0' <= c && c <= '9') || c == '-' || c == '.';
}

auto type_name(EventKind kind) -> const char *
{
    switch (kind) {
        case EventKind::kString:
            return "string";
        case EventKind::kInteger:
            return "int";
        case EventKind::kFloat:
            return "float";
        case EventKind::kBoolean:
            return "boolean";
        default:
            return "null";
    }
}

} // namespace

auto is_xml_name(const Slice &name) -> bool
{
    if (name.is_empty() || !is_name_start(name[0])) {
        return false;
    }
    for (size_t i = 1; i < name.size(); ++i) {
        if (!is_name_char(name[i])) {
            return false;
        }
    }
    return true;
}

auto to_xml_name(const Slice &key) -> std::string
{
    std::string name;
    name.reserve(key.size() + 1);
    for (size_t i = 0; i < key.size(); ++i) {
        name += is_name_char(key[i]) ? key[i] : '_';
    }
    if (name.empty() || !is_name_start(name.front())) {
        name.insert(name.begin(), '_');
    }
    return name;
}

auto escape_xml_value(const Slice &value) -> std::string
{
    static constexpr std::string_view kMarkup = "<>&\"'";
    static constexpr std::string_view kEnd = "]]>";
    std::string sanitized;
    sanitized.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (is_forbidden_char(value[i])) {
            sanitized.append(kReplacement);
        } else {
            sanitized += value[i];
        }
    }
    const std::string_view text = sanitized;
    if (text.find_first_of(kMarkup) == std::string_view::npos) {
        return sanitized;
    }
    std::string out = "<![CDATA[";
    size_t offset = 0;
    for (auto pos = text.find(kEnd); pos != std::string_view::npos; pos = text.find(kEnd, offset)) {
        // Close the section between "]]" and ">", then reopen it.
        out.append(text.substr(offset, pos + 2 - offset));
        out.append("]]><![CDATA[");
        offset = pos + 2;
    }
    out.append(text.substr(offset));
    out.append("]]>");
    return out;
}

XmlRenderer::XmlRenderer(Parser &parser, const XmlOptions &options)
    : m_options(options),
      m_parser(&parser)
{
}

auto XmlRenderer::next(std::string &fragment) -> Result<bool>
{
    fragment.clear();
    if (!m_started) {
        m_started = true;
        fragment = m_options.header + '\n';
        return true;
    }
    while (!m_finished) {
        Event event;
        auto got = m_parser->next(event);
        if (!got) {
            return Err {got.error()};
        } else if (!*got) {
            m_finished = true;
            break;
        }
        if (render(event, fragment)) {
            return true;
        }
    }
    return false;
}

// Append the text for `event` to `out`. Returns false if the event produces no text.
auto XmlRenderer::render(const Event &event, std::string &out) -> bool
{
    switch (event.kind) {
        case EventKind::kObjectKey:
            m_key = to_xml_name(event.text);
            return false;

        case EventKind::kBeginArray:
        case EventKind::kBeginObject:
            if (m_is_object.empty()) {
                out += '<' + m_options.root_tag + '>';
            } else {
                m_tags.emplace_back(child_tag());
                indent(out);
                out += '<' + m_tags.back() + '>';
            }
            newline(out);
            m_is_object.emplace_back(event.kind == EventKind::kBeginObject);
            return true;

        case EventKind::kEndArray:
        case EventKind::kEndObject:
            JSONEVENT_EXPECT_FALSE(m_is_object.empty());
            m_is_object.pop_back();
            if (m_is_object.empty()) {
                out += "</" + m_options.root_tag + '>';
            } else {
                indent(out);
                out += "</" + m_tags.back() + '>';
                m_tags.pop_back();
            }
            newline(out);
            return true;

        default:
            if (m_is_object.empty()) {
                render_scalar(event, m_options.root_tag, out);
            } else {
                indent(out);
                render_scalar(event, child_tag(), out);
            }
            newline(out);
            return true;
    }
}

auto XmlRenderer::render_scalar(const Event &event, const std::string &tag, std::string &out) const -> void
{
    out += '<' + tag;
    if (m_options.typed) {
        out += " type=\"";
        out += type_name(event.kind);
        out += '"';
    }
    if (event.text.empty()) {
        out += "/>";
        return;
    }
    out += '>';
    out += event.kind == EventKind::kString ? escape_xml_value(event.text) : event.text;
    out += "</" + tag + '>';
}

auto XmlRenderer::child_tag() const -> std::string
{
    JSONEVENT_EXPECT_FALSE(m_is_object.empty());
    return m_is_object.back() ? m_key : m_options.list_item;
}

auto XmlRenderer::indent(std::string &out) const -> void
{
    if (m_options.formatted) {
        out.append(m_is_object.size() * kIndentWidth, ' ');
    }
}

auto XmlRenderer::newline(std::string &out) const -> void
{
    if (m_options.formatted) {
        out += '\n';
    }
}

auto render_xml(Source &source, const Options &options, const XmlOptions &xml_options,
                std::ostream &os) -> Status
{
    Parser parser(source, options);
    XmlRenderer renderer(parser, xml_options);
    std::string fragment;
    for (;;) {
        auto got = renderer.next(fragment);
        if (!got) {
            return got.error();
        } else if (!*got) {
            break;
        }
        if (!os.write(fragment.data(), static_cast<std::streamsize>(fragment.size()))) {
            return Status::system_error("cannot write XML output");
        }
    }
    if (!os.flush()) {
        return Status::system_error("cannot flush XML output");
    }
    return Status::ok();
}

} // namespace jsonevent
