#include "blobfig/path.hpp"

#include "blobfig/error.hpp"

namespace blobfig {

namespace {

// Strip one leading and one trailing '/'. False when an interior segment is
// empty.
bool trim_path(std::string_view& path) {
    if (!path.empty() && path.front() == '/') path.remove_prefix(1);
    if (!path.empty() && path.back() == '/') path.remove_suffix(1);
    if (path.empty()) return true;
    if (path.front() == '/' || path.back() == '/') return false;
    return path.find("//") == std::string_view::npos;
}

// Pops the next segment off `rest`.
std::string_view next_segment(std::string_view& rest) {
    auto slash = rest.find('/');
    std::string_view seg = rest.substr(0, slash);
    if (slash == std::string_view::npos) {
        rest = {};
    } else {
        rest.remove_prefix(slash + 1);
    }
    return seg;
}

} // namespace

std::optional<std::vector<std::string_view>> split_path(std::string_view path) {
    if (!trim_path(path)) return std::nullopt;
    std::vector<std::string_view> out;
    while (!path.empty()) out.push_back(next_segment(path));
    return out;
}

std::optional<ValueView> get(const ValueView& root, std::string_view path) {
    if (!trim_path(path)) return std::nullopt;
    ValueView cur = root;
    while (!path.empty()) {
        std::string_view seg = next_segment(path);
        if (cur.tag() != ValueTag::Object) return std::nullopt;
        auto child = cur.as_object().get(seg);
        if (!child) return std::nullopt;
        cur = *child;
    }
    return cur;
}

ValueView at(const ValueView& root, std::string_view path) {
    auto parts = split_path(path);
    if (!parts) {
        throw AccessError(AccessErrorKind::MalformedPath, std::string(path),
                          "malformed path '" + std::string(path) + "' (empty segment)");
    }
    ValueView cur = root;
    for (std::size_t i = 0; i < parts->size(); ++i) {
        if (cur.tag() != ValueTag::Object) {
            std::string where = i == 0 ? std::string("<root>") : join_path(*parts, i);
            throw AccessError(AccessErrorKind::NotAnObject, std::string(path),
                              "'" + where + "' is " + to_string(cur.tag()) + ", not an object");
        }
        auto child = cur.as_object().get((*parts)[i]);
        if (!child) {
            throw AccessError(AccessErrorKind::NotFound, std::string(path),
                              "key not found: " + join_path(*parts, i + 1));
        }
        cur = *child;
    }
    return cur;
}

std::string join_path(const std::vector<std::string_view>& parts, std::size_t upto) {
    std::string out;
    for (std::size_t i = 0; i < parts.size() && i < upto; ++i) {
        if (i) out.push_back('/');
        out.append(parts[i]);
    }
    return out;
}

} // namespace blobfig
