#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <atomic>
#include <iterator>
#include <thread>

#include "application/CacheMaintenanceScheduler.hpp"
#include "application/SubdocumentExtractionService.hpp"
#include "domain/ContentErrors.hpp"
#include "infrastructure/PathUtils.hpp"
#include "test/TestDoubles.hpp"

using namespace omnisplit::domain;
using namespace omnisplit::application;
using omnisplit::infrastructure::PathUtils;
using omnisplit::test::CountingSlicer;
using omnisplit::test::InMemoryRepository;
using omnisplit::test::SlowSlicer;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
    std::shared_ptr<InMemoryRepository> MakeRepository(const fs::path& source) {
        auto repo = std::make_shared<InMemoryRepository>();
        Omnibus omnibus;
        omnibus.id = "poe";
        omnibus.name = "The Complete Poems";
        omnibus.url = PathUtils::PathToFileUrl(source);
        repo->saveOmnibus(omnibus);

        VirtualBook raven;
        raven.id = "poe-1";
        raven.omnibusId = "poe";
        raven.title = "The Raven";
        raven.number = raven.numberSort = 1.0f;
        raven.url = omnibus.url + "#text/raven.xhtml";
        VirtualBook annabel = raven;
        annabel.id = "poe-2";
        annabel.title = "Annabel Lee";
        annabel.number = annabel.numberSort = 2.0f;
        annabel.url = omnibus.url + "#text/annabel.xhtml";
        repo->saveAll({raven, annabel});
        return repo;
    }

    std::string ReadText(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    size_t CountFiles(const fs::path& dir) {
        if (!fs::exists(dir)) return 0;
        return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
    }

    template<typename Error, typename F>
    bool Throws(F&& f) {
        try {
            f();
        } catch (const Error&) {
            return true;
        }
        return false;
    }
}

int main() {
    std::cout << "[Test] Starting SubdocumentExtractionService Test..." << std::endl;

    const fs::path testRoot = fs::absolute("test_project_root_extraction");
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);
    const fs::path source = testRoot / "poe.epub";
    std::ofstream(source) << "container bytes";
    const fs::path cacheDir = testRoot / "cache";

    assert(SubdocumentExtractionService::cacheFileName(source, "poe-1") == "poe-poe-1.epub");
    assert(SubdocumentExtractionService::cacheFileName(source, "a/b c") == "poe-a%2Fb%20c.epub");
    assert(SubdocumentExtractionService::cacheFileName(source, "a_b") == "poe-a_b.epub");
    assert(SubdocumentExtractionService::cacheFileName(source, "a%2Fb") == "poe-a%252Fb.epub");

    // Construction needs a cache directory.
    assert(Throws<std::invalid_argument>([] {
        SubdocumentExtractionService(std::make_shared<InMemoryRepository>(), std::make_shared<CountingSlicer>(),
                                     std::make_shared<AsyncTaskManager>(1), ExtractionServiceOptions{});
    }));

    // Cache hit after the first extraction, one slicer call for concurrent requests.
    {
        auto repo = MakeRepository(source);
        auto slicer = std::make_shared<CountingSlicer>(100ms);
        auto pool = std::make_shared<AsyncTaskManager>(2);
        SubdocumentExtractionService service(repo, slicer, pool, {cacheDir, 0ms, true});

        std::vector<std::thread> callers;
        std::vector<fs::path> paths(8);
        for (size_t i = 0; i < paths.size(); ++i) {
            callers.emplace_back([&service, &paths, i] { paths[i] = service.getContent("poe-1").path(); });
        }
        for (auto& t : callers) t.join();

        assert(slicer->calls == 1 && "Concurrent requests share one extraction.");
        for (const auto& p : paths) assert(p == cacheDir / "poe-poe-1.epub");

        ContentResource again = service.getContent("poe-1");
        assert(slicer->calls == 1 && "Cached content is reused.");
        assert(ReadText(again.path()) == "text/raven.xhtml|The Raven");
        assert(again.size() == ReadText(again.path()).size());

        auto bytes = again.readAll();
        assert(std::string(bytes.begin(), bytes.end()) == "text/raven.xhtml|The Raven");

        // The size is fixed when the resource is handed out; a file truncated since then is an error.
        {
            fs::path copy = testRoot / "truncated.epub";
            fs::copy_file(again.path(), copy, fs::copy_options::overwrite_existing);
            ContentResource snapshot(copy);
            std::ofstream(copy, std::ios::trunc) << "short";
            assert(Throws<ResourceAccessError>([&] { snapshot.readAll(); }));
            fs::remove(copy);
        }

        // Async path lands on the same cache file.
        auto future = service.getContentAsync("poe-2");
        assert(future.get().path() == cacheDir / "poe-poe-2.epub");
        assert(slicer->calls == 2);

        // A container newer than its cached slice forces regeneration.
        fs::last_write_time(source, fs::file_time_type::clock::now() + 1h);
        service.getContent("poe-1");
        assert(slicer->calls == 3);

        // Eviction removes every cached slice of the omnibus.
        assert(service.evictOmnibus(*repo->findOmnibus("poe")) == 2);
        assert(CountFiles(cacheDir) == 0);
    }

    // Ids that differ only in punctuation get their own cache files.
    {
        auto repo = MakeRepository(source);
        VirtualBook slashed = *repo->findById("poe-1");
        slashed.id = "a/b";
        VirtualBook underscored = *repo->findById("poe-2");
        underscored.id = "a_b";
        repo->saveAll({slashed, underscored});

        auto slicer = std::make_shared<CountingSlicer>();
        SubdocumentExtractionService service(repo, slicer, std::make_shared<AsyncTaskManager>(1), {cacheDir, 0ms, true});

        fs::path first = service.getContent("a/b").path();
        fs::path second = service.getContent("a_b").path();
        assert(first != second);
        assert(slicer->calls == 2);
        assert(ReadText(first) == "text/raven.xhtml|The Raven");
        assert(ReadText(second) == "text/annabel.xhtml|Annabel Lee");
        assert(first.parent_path() == cacheDir && second.parent_path() == cacheDir);
        assert(service.cleanupCache(0) == 2);
    }

    // A caller that gives up early does not fail one still willing to wait.
    {
        auto repo = MakeRepository(source);
        auto slicer = std::make_shared<CountingSlicer>(300ms);
        SubdocumentExtractionService service(repo, slicer, std::make_shared<AsyncTaskManager>(1), {cacheDir, 0ms, true});

        std::atomic<bool> firstTimedOut{false};
        std::thread impatient([&] {
            firstTimedOut = Throws<ExtractionTimeoutError>([&] { service.getContent("poe-1", 50ms); });
        });
        std::this_thread::sleep_for(10ms);
        ContentResource patient = service.getContent("poe-1", 0ms);
        impatient.join();

        assert(firstTimedOut && "The short deadline still applies to its own caller.");
        assert(ReadText(patient.path()) == "text/raven.xhtml|The Raven");
        assert(slicer->calls == 1);
        assert(service.cleanupCache(0) == 1);
    }

    // Lookup failures
    {
        auto repo = MakeRepository(source);
        auto slicer = std::make_shared<CountingSlicer>();
        SubdocumentExtractionService service(repo, slicer, std::make_shared<AsyncTaskManager>(1), {cacheDir, 0ms, true});

        assert(Throws<ContentNotFoundError>([&] { service.getContent("nope"); }));
        assert(!service.contentExists("nope"));
        assert(service.contentExists("poe-1"));

        Omnibus moved = *repo->findOmnibus("poe");
        moved.url = PathUtils::PathToFileUrl(testRoot / "moved.epub");
        repo->saveOmnibus(moved);
        assert(Throws<ContentNotFoundError>([&] { service.getContent("poe-1"); }));
        assert(!service.contentExists("poe-1"));

        moved.url = "relative/poe.epub";
        repo->saveOmnibus(moved);
        assert(Throws<ContentNotFoundError>([&] { service.getContent("poe-1"); }));
        assert(slicer->calls == 0);
    }

    // Slicer failure leaves nothing behind and is retried next time.
    {
        auto repo = MakeRepository(source);
        auto slicer = std::make_shared<CountingSlicer>();
        slicer->failWith = "corrupt archive";
        SubdocumentExtractionService service(repo, slicer, std::make_shared<AsyncTaskManager>(1), {cacheDir, 0ms, true});

        assert(Throws<ExtractionFailedError>([&] { service.getContent("poe-1"); }));
        assert(CountFiles(cacheDir) == 0 && "Failed output must be removed.");

        slicer->failWith.reset();
        service.getContent("poe-1");
        assert(slicer->calls == 2);
        assert(service.cleanupCache(0) == 1);
    }

    // Timeout cancels the extraction and leaves no file.
    {
        auto repo = MakeRepository(source);
        auto slicer = std::make_shared<SlowSlicer>();
        auto pool = std::make_shared<AsyncTaskManager>(1);
        SubdocumentExtractionService service(repo, slicer, pool, {cacheDir, 0ms, true});

        assert(Throws<ExtractionTimeoutError>([&] { service.getContent("poe-1", 100ms); }));
        pool->Shutdown();
        assert(!slicer->finishedWithoutCancel && "Cancellation must reach the slicer.");
        assert(CountFiles(cacheDir) == 0 && "Neither temp nor final file survives a timeout.");
    }

    // Age-based cleanup
    {
        auto repo = MakeRepository(source);
        SubdocumentExtractionService service(repo, std::make_shared<CountingSlicer>(),
                                             std::make_shared<AsyncTaskManager>(1), {cacheDir, 0ms, true});
        fs::create_directories(cacheDir);
        std::ofstream(cacheDir / "old.epub") << "old";
        std::ofstream(cacheDir / "fresh.epub") << "fresh";
        std::ofstream(cacheDir / "poe-poe-1.epub.part-7") << "in progress";

        const auto stamped = fs::last_write_time(cacheDir / "old.epub");
        fs::last_write_time(cacheDir / "fresh.epub", stamped + 2h);

        // Exactly at the limit counts as expired, just below does not.
        assert(service.cleanupCache(3.0, stamped + 3h - 1s) == 0);
        assert(service.cleanupCache(3.0, stamped + 3h) == 1);
        assert(!fs::exists(cacheDir / "old.epub"));
        assert(fs::exists(cacheDir / "fresh.epub"));

        assert(service.cleanupCache(1e12) == 0);
        assert(service.cleanupCache(0) == 1 && "Zero removes every finished file.");
        assert(fs::exists(cacheDir / "poe-poe-1.epub.part-7") && "Temp files are left alone.");
        fs::remove(cacheDir / "poe-poe-1.epub.part-7");

        fs::remove_all(cacheDir);
        assert(service.cleanupCache(0) == 0 && "A missing directory is not an error.");
    }

    std::cout << "[PASS] SubdocumentExtractionService Test." << std::endl;

    std::cout << "[Test] Starting CacheMaintenanceScheduler Test..." << std::endl;
    {
        auto repo = MakeRepository(source);
        auto service = std::make_shared<SubdocumentExtractionService>(
            repo, std::make_shared<CountingSlicer>(), std::make_shared<AsyncTaskManager>(1),
            ExtractionServiceOptions{cacheDir, 0ms, true});
        service->getContent("poe-1");
        assert(CountFiles(cacheDir) == 1);

        CacheMaintenanceScheduler disabled(service, 0, 0ms);
        disabled.start();
        assert(!disabled.isRunning() && "A zero interval disables the schedule.");

        CacheMaintenanceScheduler scheduler(service, 0, 20ms);
        scheduler.start();
        assert(scheduler.isRunning());
        for (int i = 0; i < 100 && CountFiles(cacheDir) > 0; ++i) std::this_thread::sleep_for(10ms);
        assert(CountFiles(cacheDir) == 0 && "The periodic sweep empties the cache.");
        scheduler.stop();
        scheduler.stop();
        assert(!scheduler.isRunning());
        assert(scheduler.runOnce() == 0);
    }
    std::cout << "[PASS] CacheMaintenanceScheduler Test." << std::endl;

    fs::remove_all(testRoot);
    return 0;
}
