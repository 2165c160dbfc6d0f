#include <rangeget/downloader/http_util.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rangeget::downloader {

namespace {

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string unquote(std::string_view v) {
    v = trimView(v);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        std::string out;
        for (std::size_t i = 1; i + 1 < v.size(); ++i) {
            if (v[i] == '\\' && i + 2 < v.size())
                ++i;
            out.push_back(v[i]);
        }
        return out;
    }
    return std::string(v);
}

} // namespace

std::string percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value) {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto total = trimView(value.substr(slash + 1));
    if (total.empty() || total == "*")
        return std::nullopt;
    std::uint64_t n = 0;
    auto res = std::from_chars(total.data(), total.data() + total.size(), n);
    if (res.ec != std::errc() || res.ptr != total.data() + total.size())
        return std::nullopt;
    return n;
}

std::optional<std::string> parseContentDispositionFilename(std::string_view value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    std::size_t pos = 0;
    while (pos <= value.size()) {
        // Split on ';' outside quotes
        std::size_t end = pos;
        bool quoted = false;
        while (end < value.size() && (quoted || value[end] != ';')) {
            if (value[end] == '"')
                quoted = !quoted;
            ++end;
        }
        auto param = trimView(value.substr(pos, end - pos));
        auto eq = param.find('=');
        if (eq != std::string_view::npos) {
            auto key = trimView(param.substr(0, eq));
            auto val = param.substr(eq + 1);
            if (iequals(key, "filename*")) {
                // charset'language'encoded-value
                auto raw = unquote(val);
                auto firstTick = raw.find('\'');
                auto secondTick =
                    firstTick == std::string::npos ? std::string::npos : raw.find('\'', firstTick + 1);
                auto encoded = secondTick == std::string::npos ? raw : raw.substr(secondTick + 1);
                extended = percentDecode(encoded);
            } else if (iequals(key, "filename")) {
                plain = unquote(val);
            }
        }
        if (end >= value.size())
            break;
        pos = end + 1;
    }

    if (extended && !extended->empty())
        return extended;
    if (plain && !plain->empty())
        return plain;
    return std::nullopt;
}

std::optional<std::string> fileNameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url = url.substr(scheme + 3);
        auto slash = url.find('/');
        if (slash == std::string_view::npos)
            return std::nullopt; // host only
        url = url.substr(slash);
    }
    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    auto last = url.rfind('/');
    auto segment = last == std::string_view::npos ? url : url.substr(last + 1);
    if (segment.empty())
        return std::nullopt;
    return percentDecode(segment);
}

std::string sanitizeFileName(std::string_view name) {
    // Keep only the final path component
    auto sep = name.find_last_of("/\\");
    if (sep != std::string_view::npos)
        name = name.substr(sep + 1);

    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7f || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' ||
            c == '>' || c == '|') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    auto trimmed = trimView(out);
    while (!trimmed.empty() && trimmed.front() == '.')
        trimmed.remove_prefix(1);
    if (trimmed.empty())
        return "download.dat";
    return std::string(trimmed);
}

} // namespace rangeget::downloader
