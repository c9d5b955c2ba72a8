#include "infrastructure/PathUtils.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace omnisplit::infrastructure {

namespace fs = std::filesystem;

namespace {
    bool StartsWith(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    int HexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool HasFileScheme(const std::string& url) {
        if (url.size() < 5) return false;
        std::string scheme = url.substr(0, 5);
        for (auto& c : scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return scheme == "file:";
    }
}

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultCacheDir() {
    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec) temp = GetCacheHome();
    return temp / "omnisplit-omnibus-cache";
}

fs::path PathUtils::GetDefaultRepositoryPath() {
    return GetDataHome() / "omnisplit" / "virtual_books.json";
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / "omnisplit" / "settings.json";
}

std::string PathUtils::PercentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = HexValue(text[i + 1]);
            int lo = HexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string PathUtils::PercentEncode(const std::string& text, bool keepSlash) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keepSlash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<fs::path> PathUtils::FileUrlToPath(const std::string& url) {
    if (url.empty()) return std::nullopt;

    if (!HasFileScheme(url)) {
        // Plain paths are taken verbatim; '#' may be part of a file name.
        fs::path plain(url);
        if (plain.is_absolute()) return plain;
        return std::nullopt;
    }

    std::string rest = url.substr(5);
    size_t cut = rest.find_first_of("#?");
    if (cut != std::string::npos) rest.erase(cut);

    if (StartsWith(rest, "//")) {
        rest.erase(0, 2);
        size_t slash = rest.find('/');
        if (slash == std::string::npos) return std::nullopt;
        std::string host = rest.substr(0, slash);
        if (!host.empty() && host != "localhost") return std::nullopt;
        rest.erase(0, slash);
    }

    if (rest.empty() || rest[0] != '/') return std::nullopt;
    return fs::path(PercentDecode(rest));
}

std::string PathUtils::PathToFileUrl(const fs::path& path) {
    return "file://" + PercentEncode(path.generic_string(), true);
}

std::optional<std::string> PathUtils::UrlFragment(const std::string& url) {
    if (!HasFileScheme(url)) return std::nullopt;
    size_t hash = url.find('#');
    if (hash == std::string::npos || hash + 1 >= url.size()) return std::nullopt;
    return PercentDecode(url.substr(hash + 1));
}

} // namespace omnisplit::infrastructure
