#include "balloon/text/markup_parser.h"
#include "balloon/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace balloon::text {

namespace {

struct Attribute {
    std::string name;
    std::string value;
};

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

bool isVoidTag(const std::string& tag) {
    return tag == "br" || tag == "img" || tag == "hr" || tag == "wbr"
        || tag == "meta" || tag == "link" || tag == "input";
}

MarkupNodeKind kindForTag(const std::string& tag) {
    if (tag == "div" || tag == "p") return MarkupNodeKind::Block;
    if (tag == "br") return MarkupNodeKind::Break;
    return MarkupNodeKind::Inline;
}

void appendUtf8(std::uint32_t cp, std::string& out) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Splits `<name attr="v" ...>` content. Returns false when the name is not
// a valid element name.
bool parseTagBody(std::string_view body, std::string& name, std::vector<Attribute>& attrs, bool& selfClosing) {
    body = trim(body);
    selfClosing = false;
    if (!body.empty() && body.back() == '/') {
        selfClosing = true;
        body.remove_suffix(1);
        body = trim(body);
    }
    if (body.empty() || !std::isalpha(static_cast<unsigned char>(body.front()))) return false;

    std::size_t i = 0;
    while (i < body.size() && !isSpace(body[i])) ++i;
    name = toLower(body.substr(0, i));

    while (i < body.size()) {
        while (i < body.size() && isSpace(body[i])) ++i;
        if (i >= body.size()) break;

        const std::size_t nameStart = i;
        while (i < body.size() && !isSpace(body[i]) && body[i] != '=') ++i;
        Attribute attr;
        attr.name = toLower(body.substr(nameStart, i - nameStart));

        while (i < body.size() && isSpace(body[i])) ++i;
        if (i < body.size() && body[i] == '=') {
            ++i;
            while (i < body.size() && isSpace(body[i])) ++i;
            if (i < body.size() && (body[i] == '"' || body[i] == '\'')) {
                const char quote = body[i++];
                const std::size_t end = body.find(quote, i);
                if (end == std::string_view::npos) return false;
                attr.value = decodeEntities(body.substr(i, end - i));
                i = end + 1;
            } else {
                const std::size_t valueStart = i;
                while (i < body.size() && !isSpace(body[i])) ++i;
                attr.value = decodeEntities(body.substr(valueStart, i - valueStart));
            }
        }
        if (!attr.name.empty()) attrs.push_back(std::move(attr));
    }
    return true;
}

std::optional<float> parseFontSize(std::string_view value) {
    const std::string v = toLower(trim(value));
    if (v.empty()) return std::nullopt;
    char* end = nullptr;
    const float number = std::strtof(v.c_str(), &end);
    if (end == v.c_str() || !(number > 0.0f)) return std::nullopt;
    const std::string_view unit = trim(std::string_view(end));
    if (unit.empty() || unit == "px") return number;
    if (unit == "pt") return number * 4.0f / 3.0f;
    // Relative units need the inherited size; they are ignored.
    return std::nullopt;
}

// First entry of a comma separated family list, unquoted.
std::string firstFamily(std::string_view list) {
    const std::size_t comma = list.find(',');
    std::string first(trim(list.substr(0, comma)));
    first.erase(std::remove_if(first.begin(), first.end(),
        [](char c) { return c == '"' || c == '\''; }), first.end());
    return std::string(trim(first));
}

bool isBoldWeight(std::string_view value) {
    const std::string v = toLower(trim(value));
    if (v == "bold" || v == "bolder") return true;
    char* end = nullptr;
    const long weight = std::strtol(v.c_str(), &end, 10);
    return end != v.c_str() && weight >= 600;
}

void applyInlineCss(std::string_view css, StyleOverrides& out) {
    std::size_t pos = 0;
    while (pos < css.size()) {
        std::size_t semi = css.find(';', pos);
        if (semi == std::string_view::npos) semi = css.size();
        const std::string_view decl = css.substr(pos, semi - pos);
        pos = semi + 1;

        const std::size_t colon = decl.find(':');
        if (colon == std::string_view::npos) continue;
        const std::string prop = toLower(trim(decl.substr(0, colon)));
        const std::string_view value = trim(decl.substr(colon + 1));
        if (value.empty()) continue;

        if (prop == "font-weight") {
            if (isBoldWeight(value)) out.bold = true;
        } else if (prop == "font-style") {
            const std::string v = toLower(value);
            if (v == "italic" || v == "oblique") out.italic = true;
        } else if (prop == "text-decoration" || prop == "text-decoration-line") {
            const std::string v = toLower(value);
            if (v.find("underline") != std::string::npos) out.underline = true;
            if (v.find("line-through") != std::string::npos) out.strikethrough = true;
        } else if (prop == "font-size") {
            if (auto size = parseFontSize(value)) out.fontSize = size;
        } else if (prop == "font-family") {
            std::string family = firstFamily(value);
            if (!family.empty()) out.fontFamily = std::move(family);
        } else if (prop == "color") {
            out.color = std::string(value);
        }
    }
}

StyleOverrides overridesFor(const std::string& tag, const std::vector<Attribute>& attrs) {
    StyleOverrides s;
    if (tag == "b" || tag == "strong") s.bold = true;
    if (tag == "i" || tag == "em") s.italic = true;
    if (tag == "u" || tag == "ins") s.underline = true;
    if (tag == "s" || tag == "strike" || tag == "del") s.strikethrough = true;

    // Legacy attributes first so an inline style wins.
    for (const Attribute& a : attrs) {
        if (a.name == "face") {
            std::string family = firstFamily(a.value);
            if (!family.empty()) s.fontFamily = std::move(family);
        } else if (a.name == "color" && !trim(a.value).empty()) {
            s.color = std::string(trim(a.value));
        }
    }
    for (const Attribute& a : attrs) {
        if (a.name == "style") applyInlineCss(a.value, s);
    }
    return s;
}

class Flattener {
public:
    std::vector<TextSegment> out;

    void visit(const MarkupNode& node, const TextStyle& inherited) {
        TextStyle style = inherited;
        node.style.applyTo(style);

        switch (node.kind) {
            case MarkupNodeKind::Text:
                if (!node.text.empty()) {
                    TextSegment seg;
                    seg.text = node.text;
                    seg.style = style;
                    out.push_back(std::move(seg));
                    lineHasContent_ = true;
                }
                break;
            case MarkupNodeKind::Break:
                breakLine(style);
                break;
            case MarkupNodeKind::Block:
                if (lineHasContent_) breakLine(style);
                visitChildren(node, style);
                if (lineHasContent_) breakLine(style);
                break;
            case MarkupNodeKind::Root:
            case MarkupNodeKind::Inline:
                visitChildren(node, style);
                break;
        }
    }

private:
    bool lineHasContent_ = false;

    void visitChildren(const MarkupNode& node, const TextStyle& style) {
        for (const MarkupNode& child : node.children) visit(child, style);
    }

    void breakLine(const TextStyle& style) {
        TextSegment seg;
        seg.isBreak = true;
        seg.style = style;
        out.push_back(std::move(seg));
        lineHasContent_ = false;
    }
};

} // namespace

void StyleOverrides::applyTo(TextStyle& style) const {
    if (bold) style.bold = true;
    if (italic) style.italic = true;
    if (underline) style.underline = true;
    if (strikethrough) style.strikethrough = true;
    if (fontSize) style.fontSize = *fontSize;
    if (fontFamily) style.fontFamily = *fontFamily;
    if (color) style.color = *color;
}

std::string decodeEntities(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }
        const std::size_t semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            out.push_back(text[i++]);
            continue;
        }
        const std::string_view name = text.substr(i + 1, semi - i - 1);
        bool known = true;
        if (name == "amp") out.push_back('&');
        else if (name == "lt") out.push_back('<');
        else if (name == "gt") out.push_back('>');
        else if (name == "quot") out.push_back('"');
        else if (name == "apos") out.push_back('\'');
        else if (name == "nbsp") out.push_back(' ');
        else if (name.size() > 1 && name[0] == '#') {
            const bool hex = name[1] == 'x' || name[1] == 'X';
            const std::string digits(name.substr(hex ? 2 : 1));
            char* end = nullptr;
            const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
            if (digits.empty() || *end != '\0') {
                known = false;
            } else {
                appendUtf8(static_cast<std::uint32_t>(cp), out);
            }
        } else {
            known = false;
        }

        if (known) {
            i = semi + 1;
        } else {
            out.push_back(text[i++]);
        }
    }
    return out;
}

bool parseMarkup(std::string_view markup, RichTextDocument& out) {
    out = RichTextDocument{};
    out.root.kind = MarkupNodeKind::Root;

    // Open elements. Only the innermost one gains children, so the
    // pointers into parent child vectors stay valid.
    std::vector<MarkupNode*> stack{&out.root};
    std::string pending;

    const auto flushText = [&]() {
        if (pending.empty()) return;
        MarkupNode node;
        node.kind = MarkupNodeKind::Text;
        node.text = decodeEntities(pending);
        pending.clear();
        if (!node.text.empty()) stack.back()->children.push_back(std::move(node));
    };

    std::size_t pos = 0;
    while (pos < markup.size()) {
        if (markup[pos] != '<') {
            const std::size_t next = markup.find('<', pos);
            const std::size_t end = next == std::string_view::npos ? markup.size() : next;
            pending.append(markup.data() + pos, end - pos);
            pos = end;
            continue;
        }

        if (markup.compare(pos, 4, "<!--") == 0) {
            const std::size_t end = markup.find("-->", pos + 4);
            if (end == std::string_view::npos) return false;
            pos = end + 3;
            continue;
        }

        const std::size_t close = markup.find('>', pos + 1);
        if (close == std::string_view::npos) return false;
        const std::string_view body = markup.substr(pos + 1, close - pos - 1);
        pos = close + 1;
        flushText();

        if (body.empty()) return false;
        if (body.front() == '!' || body.front() == '?') continue;

        if (body.front() == '/') {
            const std::string name = toLower(trim(body.substr(1)));
            if (isVoidTag(name)) continue;
            if (stack.size() == 1 || stack.back()->tag != name) return false;
            stack.pop_back();
            continue;
        }

        std::string name;
        std::vector<Attribute> attrs;
        bool selfClosing = false;
        if (!parseTagBody(body, name, attrs, selfClosing)) return false;

        MarkupNode node;
        node.kind = kindForTag(name);
        node.tag = name;
        node.style = overridesFor(name, attrs);

        if (isVoidTag(name)) {
            if (node.kind == MarkupNodeKind::Break) stack.back()->children.push_back(std::move(node));
            continue;
        }
        if (!selfClosing && stack.size() > kMaxMarkupDepth) return false;
        stack.back()->children.push_back(std::move(node));
        if (!selfClosing) stack.push_back(&stack.back()->children.back());
    }
    flushText();
    return stack.size() == 1;
}

RichTextDocument plainDocument(std::string_view text) {
    RichTextDocument doc;
    doc.root.kind = MarkupNodeKind::Root;
    if (!text.empty()) {
        MarkupNode node;
        node.kind = MarkupNodeKind::Text;
        node.text = std::string(text);
        doc.root.children.push_back(std::move(node));
    }
    return doc;
}

RichTextDocument parseRichText(std::string_view markup) {
    RichTextDocument doc;
    if (parseMarkup(markup, doc)) {
        return doc;
    }
    BALLOON_LOG_WARN("malformed markup, rendering %zu bytes as plain text", markup.size());
    doc = plainDocument(markup);
    doc.plainFallback = true;
    return doc;
}

std::vector<TextSegment> flattenDocument(const RichTextDocument& doc, const TextStyle& defaultStyle) {
    Flattener f;
    f.visit(doc.root, defaultStyle);
    return std::move(f.out);
}

std::string plainText(const RichTextDocument& doc) {
    std::string out;
    for (const TextSegment& seg : flattenDocument(doc, TextStyle{})) {
        if (seg.isBreak) {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            continue;
        }
        out += seg.text;
    }
    return out;
}

} // namespace balloon::text
