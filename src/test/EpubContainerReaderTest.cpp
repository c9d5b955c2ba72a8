#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/ContentErrors.hpp"
#include "infrastructure/EpubContainerReader.hpp"
#include "infrastructure/EpubPackage.hpp"
#include "test/EpubFixture.hpp"

using namespace omnisplit::domain;
using namespace omnisplit::infrastructure;
using omnisplit::test::EpubFixture;
using omnisplit::test::PoeFixture;

namespace fs = std::filesystem;

namespace {
    void CheckPoe(const EpubContainer& container) {
        assert(container.title() == std::optional<std::string>("The Complete Poems of Edgar Allan Poe"));
        assert(container.authors().size() == 1 && container.authors()[0] == "Edgar Allan Poe");
        assert(container.publishers().size() == 1 && container.publishers()[0] == "Fixture Press");
        assert(container.language() == std::optional<std::string>("en"));
        assert(!container.description().has_value());
        assert(container.subjects().size() == 1 && container.subjects()[0] == "Poetry");

        auto spine = container.spine();
        assert(spine.size() == 3);
        assert(spine[0] == "text/raven.xhtml");
        assert(spine[2] == "text/annabel.xhtml");

        auto toc = container.toc();
        assert(toc.size() == 2 && "Only the toc nav contributes entries.");
        assert(toc[0].title == std::optional<std::string>("I. The Raven"));
        assert(toc[0].href == std::optional<std::string>("text/raven.xhtml"));
        assert(toc[1].href == std::optional<std::string>("text/annabel.xhtml"));
    }
}

int main() {
    std::cout << "[Test] Starting EpubContainerReader Test..." << std::endl;

    fs::path testRoot = "test_project_root_reader";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    EpubContainerReader reader;

    // EPUB 3 navigation document
    EpubFixture epub3 = PoeFixture();
    epub3.write(testRoot / "poe3.epub");
    CheckPoe(*reader.open((testRoot / "poe3.epub").string()));

    // EPUB 2 NCX
    EpubFixture epub2 = PoeFixture();
    epub2.epub3Nav = false;
    epub2.write(testRoot / "poe2.epub");
    CheckPoe(*reader.open((testRoot / "poe2.epub").string()));

    // Nested NCX entries, fragments dropped from hrefs
    {
        EpubFixture nested;
        nested.epub3Nav = false;
        nested.documents = {
            {"novels.xhtml", EpubFixture::Xhtml("The Novels", "")},
            {"emma.xhtml", EpubFixture::Xhtml("Emma", "")},
        };
        nested.toc = {{"The Novels", "novels.xhtml", {{"Emma", "emma.xhtml#start", {}}}}};
        nested.write(testRoot / "nested.epub");

        auto toc = reader.open((testRoot / "nested.epub").string())->toc();
        assert(toc.size() == 1);
        assert(toc[0].children.size() == 1);
        assert(toc[0].children[0].href == std::optional<std::string>("emma.xhtml"));
    }

    // Not a zip archive
    {
        std::ofstream(testRoot / "plain.epub") << "this is not a zip";
        bool threw = false;
        try {
            reader.open((testRoot / "plain.epub").string());
        } catch (const ContainerUnreadableError&) {
            threw = true;
        }
        assert(threw && "A non-archive must be reported as unreadable.");
    }

    // Zip without META-INF/container.xml
    {
        {
            ZipWriter zip(testRoot / "bare.epub");
            zip.add("mimetype", "application/epub+zip", true);
            zip.add("hello.txt", "hello");
            zip.close();
        }
        bool threw = false;
        try {
            reader.open((testRoot / "bare.epub").string());
        } catch (const ContainerUnreadableError&) {
            threw = true;
        }
        assert(threw && "An archive without a package document must be unreadable.");
    }

    // Missing file
    {
        bool threw = false;
        try {
            reader.open((testRoot / "nowhere.epub").string());
        } catch (const ContainerUnreadableError&) {
            threw = true;
        }
        assert(threw);
    }

    assert(EpubPackage::NormalizePath("OEBPS/text/../images/./a.png") == "OEBPS/images/a.png");
    assert(EpubPackage::ResolveHref("text/raven.xhtml", "../styles/poe.css") == "styles/poe.css");
    assert(EpubPackage::ResolveHref("text/raven.xhtml", "raven-2.xhtml#x") == "text/raven-2.xhtml");
    assert(EpubPackage::DirName("text/raven.xhtml") == "text/");

    fs::remove_all(testRoot);
    std::cout << "[PASS] EpubContainerReader Test." << std::endl;
    return 0;
}
