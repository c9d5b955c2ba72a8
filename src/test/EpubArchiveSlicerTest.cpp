#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include "domain/ContentErrors.hpp"
#include "infrastructure/EpubArchiveSlicer.hpp"
#include "infrastructure/EpubContainerReader.hpp"
#include "infrastructure/EpubPackage.hpp"
#include "infrastructure/ZipArchive.hpp"
#include "test/EpubFixture.hpp"

using namespace omnisplit::domain;
using namespace omnisplit::infrastructure;
using omnisplit::test::EpubFixture;
using omnisplit::test::PoeFixture;

namespace fs = std::filesystem;

namespace {
    std::string ReadBytes(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    Work MakeWork(const std::string& title, const std::string& href, int position) {
        Work work;
        work.title = title;
        work.href = href;
        work.position = position;
        work.type = WorkType::Poem;
        work.metadata["author0"] = "Edgar Allan Poe";
        work.metadata["language"] = "en";
        return work;
    }
}

int main() {
    std::cout << "[Test] Starting EpubArchiveSlicer Test..." << std::endl;

    fs::path testRoot = "test_project_root_slicer";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);
    const fs::path source = testRoot / "poe.epub";
    PoeFixture().write(source);

    EpubArchiveSlicer slicer;
    CancellationToken token;

    // Document selection runs until the next work's TOC target.
    {
        ZipReader zip(source);
        EpubPackage package = EpubPackage::Load(zip);
        auto raven = EpubArchiveSlicer::SelectDocuments(package, "text/raven.xhtml");
        assert(raven.size() == 2);
        assert(raven[1] == "text/raven-2.xhtml");
        auto annabel = EpubArchiveSlicer::SelectDocuments(package, "text/annabel.xhtml");
        assert(annabel.size() == 1);

        bool threw = false;
        try {
            EpubArchiveSlicer::SelectDocuments(package, "text/missing.xhtml");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Unknown documents cannot be sliced.");
    }

    // A section sharing its first child's document does not widen that child's slice.
    {
        EpubFixture delphi;
        delphi.title = "Delphi Complete Works";
        delphi.documents = {
            {"s1.xhtml", EpubFixture::Xhtml("The Novels", "<p>Novel A begins</p>")},
            {"a2.xhtml", EpubFixture::Xhtml("Chapter II", "<p>Novel A continues</p>")},
            {"b.xhtml", EpubFixture::Xhtml("Novel B", "<p>Novel B</p>")},
            {"b2.xhtml", EpubFixture::Xhtml("Chapter II", "<p>Novel B continues</p>")},
        };
        delphi.toc = {
            {"The Novels", "s1.xhtml", {
                {"Novel A", "s1.xhtml", {}},
                {"Novel B", "b.xhtml", {}},
            }},
        };
        const fs::path delphiPath = testRoot / "delphi.epub";
        delphi.write(delphiPath);

        ZipReader zip(delphiPath);
        EpubPackage package = EpubPackage::Load(zip);
        const std::vector<std::string> novelA = {"s1.xhtml", "a2.xhtml"};
        const std::vector<std::string> novelB = {"b.xhtml", "b2.xhtml"};
        assert(EpubArchiveSlicer::SelectDocuments(package, "s1.xhtml") == novelA);
        assert(EpubArchiveSlicer::SelectDocuments(package, "b.xhtml") == novelB);

        slicer.extract(MakeWork("Novel A", "s1.xhtml", 1), delphiPath, testRoot / "novel-a.epub", token);
        ZipReader sliced(testRoot / "novel-a.epub");
        assert(sliced.contains("OEBPS/s1.xhtml") && sliced.contains("OEBPS/a2.xhtml"));
        assert(!sliced.contains("OEBPS/b.xhtml") && "The sibling novel stays out.");
    }

    const Work raven = MakeWork("The Raven", "text/raven.xhtml", 1);
    slicer.extract(raven, source, testRoot / "raven-a.epub", token);
    slicer.extract(raven, source, testRoot / "raven-b.epub", token);

    // Layout
    {
        ZipReader zip(testRoot / "raven-a.epub");
        const std::vector<std::string> expected = {
            "mimetype",
            "META-INF/container.xml",
            "OEBPS/content.opf",
            "OEBPS/omnisplit-toc.ncx",
            "OEBPS/omnisplit-nav.xhtml",
            "OEBPS/text/raven.xhtml",
            "OEBPS/text/raven-2.xhtml",
            "OEBPS/images/paper.png",
            "OEBPS/images/raven.png",
            "OEBPS/styles/poe.css",
        };
        assert(zip.entryNames() == expected);
        assert(zip.read("mimetype") == "application/epub+zip");
        assert(zip.read("OEBPS/images/paper.png") == "paper-bytes");
        assert(!zip.contains("OEBPS/text/annabel.xhtml") && "Other works stay out.");
        assert(!zip.contains("OEBPS/images/sea.png"));

        std::string opf = zip.read("OEBPS/content.opf");
        assert(opf.find("omnisplit:position") != std::string::npos);
        assert(opf.find("2020-01-01T00:00:00Z") != std::string::npos && "dcterms:modified comes from the source.");
    }

    // Same input, same bytes.
    assert(ReadBytes(testRoot / "raven-a.epub") == ReadBytes(testRoot / "raven-b.epub"));

    // The slice is itself a readable container.
    {
        EpubContainerReader reader;
        auto sliced = reader.open((testRoot / "raven-a.epub").string());
        assert(sliced->title() == std::optional<std::string>("The Raven"));
        assert(sliced->authors().size() == 1 && sliced->authors()[0] == "Edgar Allan Poe");
        auto spine = sliced->spine();
        assert(spine.size() == 2 && spine[0] == "text/raven.xhtml");
        auto toc = sliced->toc();
        assert(toc.size() == 1 && toc[0].href == std::optional<std::string>("text/raven.xhtml"));
    }

    // Cancelled before starting
    {
        CancellationToken cancelled;
        cancelled.cancel();
        bool threw = false;
        try {
            slicer.extract(MakeWork("Annabel Lee", "text/annabel.xhtml", 2), source, testRoot / "annabel.epub", cancelled);
        } catch (const ExtractionCancelledError&) {
            threw = true;
        }
        assert(threw);

        // A deadline that has already passed counts as cancelled.
        CancellationToken expired = CancellationToken::WithTimeout(std::chrono::milliseconds(0));
        threw = false;
        try {
            slicer.extract(MakeWork("Annabel Lee", "text/annabel.xhtml", 2), source, testRoot / "annabel.epub", expired);
        } catch (const ExtractionCancelledError&) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(testRoot / "annabel.epub"));
    }

    // Reference scanning
    {
        auto css = EpubArchiveSlicer::CssReferences(
            "@import 'base.css'; p { background: url( \"img/a.png\" ); } "
            "@font-face { src: url(http://example.com/f.woff); } q { background: url(data:image/png;base64,AA) }");
        assert(css.size() == 2);
        assert(css[0] == "img/a.png");
        assert(css[1] == "base.css");

        auto refs = EpubArchiveSlicer::XhtmlReferences(
            "<html xmlns=\"http://www.w3.org/1999/xhtml\"><body>"
            "<a href=\"other.xhtml\">x</a><img src=\"pic.jpg\"/>"
            "<div style=\"background: url('bg.png')\"/><a href=\"#note\">n</a>"
            "</body></html>");
        assert(refs.size() == 2);
        assert(std::find(refs.begin(), refs.end(), "pic.jpg") != refs.end());
        assert(std::find(refs.begin(), refs.end(), "bg.png") != refs.end());

        assert(EpubArchiveSlicer::XhtmlReferences("<html><body><p>unclosed").empty());
    }

    fs::remove_all(testRoot);
    std::cout << "[PASS] EpubArchiveSlicer Test." << std::endl;
    return 0;
}
