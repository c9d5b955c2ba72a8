#include "infrastructure/EpubContainerReader.hpp"
#include "domain/ContentErrors.hpp"
#include "infrastructure/EpubPackage.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace omnisplit::infrastructure {

namespace {
    std::optional<std::string> First(const std::vector<std::string>& values) {
        if (values.empty()) return std::nullopt;
        return values.front();
    }

    class EpubFileContainer : public domain::EpubContainer {
    public:
        explicit EpubFileContainer(EpubPackage package) : m_package(std::move(package)) {}

        std::vector<domain::TocEntry> toc() const override { return m_package.toc(); }
        std::vector<std::string> spine() const override { return m_package.spine(); }

        std::optional<std::string> title() const override { return First(m_package.metadata().titles); }
        std::vector<std::string> authors() const override { return m_package.metadata().creators; }
        std::optional<std::string> description() const override { return First(m_package.metadata().descriptions); }
        std::optional<std::string> language() const override { return First(m_package.metadata().languages); }
        std::vector<std::string> publishers() const override { return m_package.metadata().publishers; }
        std::vector<std::string> subjects() const override { return m_package.metadata().subjects; }

    private:
        EpubPackage m_package;
    };
}

std::unique_ptr<domain::EpubContainer> EpubContainerReader::open(const std::string& path) {
    std::unique_ptr<ZipReader> zip;
    try {
        zip = std::make_unique<ZipReader>(path);
    } catch (const std::runtime_error& e) {
        throw domain::ContainerUnreadableError(e.what());
    }
    return std::make_unique<EpubFileContainer>(EpubPackage::Load(*zip));
}

} // namespace omnisplit::infrastructure
