// PathUtils Header
#pragma once
#include <string>
#include <optional>
#include <filesystem>

namespace omnisplit::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief <temp dir>/omnisplit-omnibus-cache. Not created here. */
    static std::filesystem::path GetDefaultCacheDir();

    /** @brief <data home>/omnisplit/virtual_books.json. */
    static std::filesystem::path GetDefaultRepositoryPath();

    /** @brief <config home>/omnisplit/settings.json. */
    static std::filesystem::path GetDefaultConfigPath();

    /**
     * @brief Local path behind a container location.
     * Accepts file: URLs (fragment and query dropped, percent-decoded) and
     * absolute paths. Returns nullopt for anything else.
     */
    static std::optional<std::filesystem::path> FileUrlToPath(const std::string& url);

    /** @brief file:// URL for an absolute path, percent-encoding reserved characters. */
    static std::string PathToFileUrl(const std::filesystem::path& path);

    /** @brief Decoded text after '#' in a file: URL, nullopt if absent or empty. */
    static std::optional<std::string> UrlFragment(const std::string& url);

    static std::string PercentDecode(const std::string& text);
    static std::string PercentEncode(const std::string& text, bool keepSlash);
};

} // namespace omnisplit::infrastructure
