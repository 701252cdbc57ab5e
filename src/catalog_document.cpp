#include "catalog_document.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace product_sync {

namespace {

using Json = nlohmann::ordered_json;

constexpr std::size_t npos = std::string::npos;

struct ObjectSpan;

/// Byte offsets of one `"key": value` pair in the source text.
struct MemberSpan {
    std::string                 key;
    std::size_t                 keyBegin   = 0;
    std::size_t                 valueBegin = 0;
    std::size_t                 valueEnd   = 0;
    std::size_t                 comma      = npos;   // separator after the value
    std::unique_ptr<ObjectSpan> object;              // set when the value is an object
};

struct ObjectSpan {
    std::size_t             open  = 0;
    std::size_t             close = 0;
    std::vector<MemberSpan> members;
};

struct Edit {
    std::size_t begin;
    std::size_t end;
    std::string text;
};

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// ---------------------------------------------------------------------------
// Scanner: records where every object member sits in the text
// ---------------------------------------------------------------------------

class Scanner {
public:
    explicit Scanner(const std::string& text)
        : mText(text) {}

    ObjectSpan scanRoot() {
        const std::size_t pos = skipTrivia(0);
        if (pos >= mText.size() || mText[pos] != '{') {
            fail(pos, "expected an object");
        }
        ObjectSpan root;
        const std::size_t end = scanObject(pos, root);
        if (skipTrivia(end) != mText.size()) {
            fail(end, "unexpected content after the document");
        }
        return root;
    }

private:
    const std::string& mText;

    [[noreturn]] void fail(std::size_t pos, const char* what) const {
        throw std::runtime_error("Cannot edit document at offset " + std::to_string(pos) +
                                 ": " + what);
    }

    std::size_t skipTrivia(std::size_t pos) const {
        while (pos < mText.size()) {
            if (isSpace(mText[pos])) {
                ++pos;
            } else if (mText.compare(pos, 2, "//") == 0) {
                pos = mText.find('\n', pos);
                if (pos == npos) return mText.size();
            } else if (mText.compare(pos, 2, "/*") == 0) {
                const std::size_t end = mText.find("*/", pos + 2);
                if (end == npos) fail(pos, "unterminated comment");
                pos = end + 2;
            } else {
                break;
            }
        }
        return pos;
    }

    std::size_t scanString(std::size_t pos) const {
        for (std::size_t i = pos + 1; i < mText.size(); ++i) {
            if (mText[i] == '\\') {
                ++i;
            } else if (mText[i] == '"') {
                return i + 1;
            }
        }
        fail(pos, "unterminated string");
    }

    std::size_t scanValue(std::size_t pos, std::unique_ptr<ObjectSpan>* object) {
        if (pos >= mText.size()) fail(pos, "expected a value");

        switch (mText[pos]) {
            case '{': {
                auto span = std::make_unique<ObjectSpan>();
                const std::size_t end = scanObject(pos, *span);
                if (object) *object = std::move(span);
                return end;
            }
            case '[':
                return scanArray(pos);
            case '"':
                return scanString(pos);
            default:
                break;
        }

        // Number or literal.
        std::size_t end = pos;
        while (end < mText.size() && !isSpace(mText[end]) && mText[end] != ',' &&
               mText[end] != ']' && mText[end] != '}' && mText[end] != '/') {
            ++end;
        }
        if (end == pos) fail(pos, "expected a value");
        return end;
    }

    std::size_t scanArray(std::size_t pos) {
        pos = skipTrivia(pos + 1);
        if (pos < mText.size() && mText[pos] == ']') return pos + 1;

        while (true) {
            pos = skipTrivia(scanValue(pos, nullptr));
            if (pos >= mText.size()) fail(pos, "unterminated array");
            if (mText[pos] == ']') return pos + 1;
            if (mText[pos] != ',') fail(pos, "expected ',' or ']'");
            pos = skipTrivia(pos + 1);
        }
    }

    std::size_t scanObject(std::size_t pos, ObjectSpan& span) {
        span.open = pos;
        pos = skipTrivia(pos + 1);
        if (pos < mText.size() && mText[pos] == '}') {
            span.close = pos;
            return pos + 1;
        }

        while (true) {
            if (pos >= mText.size() || mText[pos] != '"') fail(pos, "expected a key");

            MemberSpan member;
            member.keyBegin = pos;
            const std::size_t keyEnd = scanString(pos);
            member.key = Json::parse(mText.substr(pos, keyEnd - pos)).get<std::string>();

            pos = skipTrivia(keyEnd);
            if (pos >= mText.size() || mText[pos] != ':') fail(pos, "expected ':'");

            member.valueBegin = skipTrivia(pos + 1);
            member.valueEnd   = scanValue(member.valueBegin, &member.object);

            pos = skipTrivia(member.valueEnd);
            const bool more = pos < mText.size() && mText[pos] == ',';
            if (more) member.comma = pos;
            span.members.push_back(std::move(member));

            if (more) {
                pos = skipTrivia(pos + 1);
                continue;
            }
            if (pos < mText.size() && mText[pos] == '}') {
                span.close = pos;
                return pos + 1;
            }
            fail(pos, "expected ',' or '}'");
        }
    }
};

// ---------------------------------------------------------------------------
// Patcher: turns the difference between text and target into edits
// ---------------------------------------------------------------------------

class Patcher {
public:
    explicit Patcher(const std::string& text)
        : mText(text) {}

    void patchObject(const ObjectSpan& span, const Json& updated);
    std::string apply();

private:
    const std::string& mText;
    std::vector<Edit>  mEdits;

    std::size_t lineStart(std::size_t pos) const {
        const std::size_t nl = pos == 0 ? npos : mText.rfind('\n', pos - 1);
        return nl == npos ? 0 : nl + 1;
    }

    /// Leading whitespace of the line holding @p pos.
    std::string lineIndent(std::size_t pos) const {
        const std::size_t start = lineStart(pos);
        std::size_t end = start;
        while (end < pos && (mText[end] == ' ' || mText[end] == '\t')) ++end;
        return mText.substr(start, end - start);
    }

    /// First offset after the spaces and comments that finish the line of @p pos.
    std::size_t lineTail(std::size_t pos) const {
        while (pos < mText.size()) {
            if (mText[pos] == ' ' || mText[pos] == '\t') {
                ++pos;
            } else if (mText.compare(pos, 2, "//") == 0) {
                std::size_t nl = mText.find('\n', pos);
                if (nl == npos) return mText.size();
                if (nl > pos && mText[nl - 1] == '\r') --nl;
                return nl;
            } else if (mText.compare(pos, 2, "/*") == 0) {
                const std::size_t end = mText.find("*/", pos + 2);
                if (end == npos || mText.find('\n', pos) < end) break;
                pos = end + 2;
            } else {
                break;
            }
        }
        return pos;
    }

    static std::string render(const Json& value, const std::string& indent) {
        std::string out;
        for (char c : value.dump(4)) {
            out.push_back(c);
            if (c == '\n') out += indent;
        }
        return out;
    }

    Json parseSpan(std::size_t begin, std::size_t end) const {
        return Json::parse(mText.substr(begin, end - begin), nullptr,
                           /*allow_exceptions=*/true, /*ignore_comments=*/true);
    }

    void eraseMember(const MemberSpan& member);
};

void Patcher::eraseMember(const MemberSpan& member) {
    std::size_t begin = member.keyBegin;
    std::size_t end   = (member.comma != npos) ? member.comma + 1 : member.valueEnd;

    // A member alone on its line takes the whole line with it.
    const std::size_t start = lineStart(begin);
    if (start + lineIndent(begin).size() == begin) {
        std::size_t after = end;
        while (after < mText.size() &&
               (mText[after] == ' ' || mText[after] == '\t' || mText[after] == '\r')) {
            ++after;
        }
        if (after < mText.size() && mText[after] == '\n') {
            begin = start;
            end   = after + 1;
        }
    }
    mEdits.push_back(Edit{begin, end, ""});
}

void Patcher::patchObject(const ObjectSpan& span, const Json& updated) {
    const MemberSpan* lastKept = nullptr;
    for (const auto& m : span.members) {
        if (updated.contains(m.key)) lastKept = &m;
    }

    std::vector<std::string> added;
    for (auto it = updated.begin(); it != updated.end(); ++it) {
        const std::string& key = it.key();
        const bool known = std::any_of(span.members.begin(), span.members.end(),
                                       [&key](const MemberSpan& m) { return m.key == key; });
        if (!known) added.push_back(key);
    }

    if (lastKept == nullptr) {
        if (!added.empty() || !span.members.empty()) {
            mEdits.push_back(Edit{span.open, span.close + 1,
                                  render(updated, lineIndent(span.open))});
        }
        return;
    }

    for (const auto& m : span.members) {
        if (!updated.contains(m.key)) {
            eraseMember(m);
            continue;
        }
        const Json& value = updated.at(m.key);
        if (m.object && value.is_object()) {
            patchObject(*m.object, value);
        } else if (parseSpan(m.valueBegin, m.valueEnd) != value) {
            mEdits.push_back(Edit{m.valueBegin, m.valueEnd,
                                  render(value, lineIndent(m.keyBegin))});
        }
    }

    const bool lastIsFinal = (lastKept == &span.members.back());

    if (added.empty()) {
        // Members after lastKept were all removed; so must its separator be.
        if (!lastIsFinal) {
            mEdits.push_back(Edit{lastKept->comma, lastKept->comma + 1, ""});
        }
        return;
    }

    const std::string indent = lineIndent(lastKept->keyBegin);
    std::string block;
    for (std::size_t i = 0; i < added.size(); ++i) {
        if (i > 0) block += ",";
        block += "\n" + indent + Json(added[i]).dump() + ": " +
                 render(updated.at(added[i]), indent);
    }

    if (lastIsFinal) {
        mEdits.push_back(Edit{lastKept->valueEnd, lastKept->valueEnd, ","});
        const std::size_t at = lineTail(lastKept->valueEnd);
        mEdits.push_back(Edit{at, at, block});
    } else {
        const std::size_t at = lineTail(lastKept->comma + 1);
        mEdits.push_back(Edit{at, at, block});
    }
}

std::string Patcher::apply() {
    // Insertions sort ahead of replacements starting at the same offset.
    std::stable_sort(mEdits.begin(), mEdits.end(), [](const Edit& a, const Edit& b) {
        if (a.begin != b.begin) return a.begin < b.begin;
        return (a.end - a.begin) < (b.end - b.begin);
    });

    std::string out;
    out.reserve(mText.size());
    std::size_t cursor = 0;
    for (const auto& edit : mEdits) {
        if (edit.begin < cursor) {
            throw std::logic_error("Overlapping document edits");
        }
        out.append(mText, cursor, edit.begin - cursor);
        out += edit.text;
        cursor = edit.end;
    }
    out.append(mText, cursor, npos);
    return out;
}

} // namespace

std::string patchJsonText(const std::string& original, const Json& updated) {
    if (!updated.is_object()) {
        throw std::invalid_argument("Document root must be an object");
    }

    try {
        Scanner scanner(original);
        const ObjectSpan root = scanner.scanRoot();

        Patcher patcher(original);
        patcher.patchObject(root, updated);
        return patcher.apply();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Cannot edit document: ") + e.what());
    }
}

} // namespace product_sync
