/*
 * GTest suite for ExplorerEngine - startup, persistence, autosave, export
 */

#include <fogmap/engine.hpp>
#include <fogmap/log.hpp>
#include <gtest/gtest.h>
#include <geos_c.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

using namespace fogmap;
namespace fs = std::filesystem;

constexpr std::int64_t T0 = 1700000000000LL;

class EngineTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              (std::string("fogmap_engine_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        set_log_sink(nullptr);
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    EngineConfig config() const {
        EngineConfig c;
        c.snapshot_path = (dir / "explored.wkb").string();
        c.autosave_interval_s = 0.0;
        return c;
    }

    /* Helper: a short walk north from Null Island */
    static std::vector<Fix> walk() {
        return {
            Fix{0.0, 0.000, T0, 15.0},
            Fix{0.0, 0.001, T0 + 2000, 15.0},
            Fix{0.0, 0.002, T0 + 4000, 15.0},
        };
    }
};

/* ========================================================================
 * Accumulate + export
 * ======================================================================== */

TEST_F(EngineTest, WalkBecomesOneHole) {
    ExplorerEngine engine(config());
    engine.start();

    for (const auto& f : walk()) {
        ASSERT_TRUE(engine.add_fix(f).ok);
    }

    EXPECT_GT(engine.explored_area_meters(), 0.0);
    EXPECT_TRUE(engine.tunnel_segments().empty());

    const FogPolygon fog = engine.to_renderable_polygon();
    EXPECT_EQ(fog.inners().size(), 1u);
    EXPECT_GT(signed_area(fog.outer()), 0.0);
    EXPECT_LT(signed_area(fog.inners()[0]), 0.0);

    const auto gj = engine.to_geojson();
    EXPECT_EQ(gj["type"].get<std::string>(), "Polygon");
    EXPECT_EQ(gj["coordinates"].size(), 2u);

    EXPECT_GT(engine.explored_percent_of_land(), engine.explored_percent_of_earth());
}

TEST_F(EngineTest, RejectedFixIsLogged) {
    std::vector<std::string> warnings;
    std::mutex m;
    set_log_sink([&](LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(m);
        if (level == LogLevel::warn) warnings.push_back(msg);
    });

    ExplorerEngine engine(config());
    engine.start();
    const AddFixResult r = engine.add_fix(0.0, 95.0, T0, 15.0);
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.error.empty());
    EXPECT_DOUBLE_EQ(engine.explored_area_meters(), 0.0);

    std::lock_guard<std::mutex> lock(m);
    EXPECT_FALSE(warnings.empty());
}

TEST_F(EngineTest, TeleportRecordsTunnel) {
    ExplorerEngine engine(config());
    engine.start();
    engine.add_fix(0.0, 0.0, T0, 15.0);
    engine.add_fix(0.0, 0.01, T0 + 60000, 15.0); /* ~1.1 km after a minute of silence */

    EXPECT_EQ(engine.tunnel_segments().size(), 1u);
    EXPECT_EQ(engine.to_renderable_polygon().inners().size(), 2u);
    EXPECT_EQ(engine.tunnels_geojson()["type"].get<std::string>(), "MultiLineString");
}

TEST_F(EngineTest, ResetClearsEverything) {
    ExplorerEngine engine(config());
    engine.start();
    for (const auto& f : walk()) engine.add_fix(f);
    engine.reset();
    EXPECT_DOUBLE_EQ(engine.explored_area_meters(), 0.0);
    EXPECT_TRUE(engine.to_renderable_polygon().inners().empty());
}

/* ========================================================================
 * Startup / persistence
 * ======================================================================== */

TEST_F(EngineTest, StopSavesAndNextStartLoads) {
    double area = 0.0;
    {
        ExplorerEngine engine(config());
        const StartupResult s = engine.start();
        EXPECT_EQ(s.load_status, LoadStatus::missing);
        EXPECT_TRUE(s.needs_rebuild);

        for (const auto& f : walk()) engine.add_fix(f);
        area = engine.explored_area_meters();
        engine.stop();
    }
    ASSERT_TRUE(fs::exists(dir / "explored.wkb"));

    ExplorerEngine again(config());
    const StartupResult s = again.start();
    EXPECT_EQ(s.load_status, LoadStatus::loaded);
    EXPECT_FALSE(s.needs_rebuild);
    EXPECT_NEAR(again.explored_area_meters(), area, 1e-6);
    EXPECT_EQ(again.to_renderable_polygon().inners().size(), 1u);
}

TEST_F(EngineTest, NothingExploredNothingWritten) {
    {
        ExplorerEngine engine(config());
        engine.start();
        engine.stop();
    }
    EXPECT_FALSE(fs::exists(dir / "explored.wkb"));
}

TEST_F(EngineTest, CorruptSnapshotStartsEmpty) {
    {
        std::ofstream ofs(dir / "explored.wkb", std::ios::binary);
        ofs << "definitely not wkb";
    }
    ExplorerEngine engine(config());
    const StartupResult s = engine.start();
    EXPECT_EQ(s.load_status, LoadStatus::corrupt);
    EXPECT_TRUE(s.needs_rebuild);
    EXPECT_DOUBLE_EQ(engine.explored_area_meters(), 0.0);
}

TEST_F(EngineTest, SelfIntersectingSnapshotStartsEmpty) {
    /* POLYGON((0 0, 10 10, 10 0, 0 10, 0 0)) written through GEOS */
    GEOSContextHandle_t h = GEOS_init_r();
    GEOSWKTReader* reader = GEOSWKTReader_create_r(h);
    GEOSGeometry* bowtie = GEOSWKTReader_read_r(h, reader, "POLYGON((0 0, 10 10, 10 0, 0 10, 0 0))");
    GEOSWKTReader_destroy_r(h, reader);
    ASSERT_NE(bowtie, nullptr);

    GEOSWKBWriter* writer = GEOSWKBWriter_create_r(h);
    std::size_t size = 0;
    unsigned char* buf = GEOSWKBWriter_write_r(h, writer, bowtie, &size);
    GEOSWKBWriter_destroy_r(h, writer);
    GEOSGeom_destroy_r(h, bowtie);
    ASSERT_NE(buf, nullptr);
    {
        std::ofstream ofs(dir / "explored.wkb", std::ios::binary);
        ofs.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(size));
    }
    GEOSFree_r(h, buf);
    GEOS_finish_r(h);

    ExplorerEngine engine(config());
    const StartupResult s = engine.start();
    EXPECT_EQ(s.load_status, LoadStatus::corrupt);
    EXPECT_TRUE(s.needs_rebuild);
    EXPECT_DOUBLE_EQ(engine.explored_area_meters(), 0.0);

    /* Fixes land on a clean region */
    for (const auto& f : walk()) EXPECT_TRUE(engine.add_fix(f).ok);
    EXPECT_GT(engine.explored_area_meters(), 0.0);
}

TEST_F(EngineTest, BootstrapOnlyWhenEmpty) {
    ExplorerEngine engine(config());
    engine.start();

    EXPECT_FALSE(engine.bootstrap_from_history({}));
    EXPECT_TRUE(engine.bootstrap_from_history(walk()));
    const double area = engine.explored_area_meters();
    EXPECT_GT(area, 0.0);

    /* Second call sees explored area and leaves it alone */
    EXPECT_FALSE(engine.bootstrap_from_history({Fix{10.0, 10.0, T0, 15.0}}));
    EXPECT_DOUBLE_EQ(engine.explored_area_meters(), area);
}

TEST_F(EngineTest, SaveNowWithoutPath) {
    EngineConfig c = config();
    c.snapshot_path.clear();
    ExplorerEngine engine(c);
    const StartupResult s = engine.start();
    EXPECT_TRUE(s.needs_rebuild);
    EXPECT_FALSE(engine.save_now().ok);
}

TEST_F(EngineTest, AutosaveWritesInBackground) {
    EngineConfig c = config();
    c.autosave_interval_s = 0.05;
    ExplorerEngine engine(c);
    engine.start();
    for (const auto& f : walk()) engine.add_fix(f);

    const fs::path snap = dir / "explored.wkb";
    for (int i = 0; i < 100 && !fs::exists(snap); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(fs::exists(snap));
    engine.stop();
}

TEST_F(EngineTest, AutosaveRecoversWhenDirectoryReturns) {
    EngineConfig c = config();
    c.snapshot_path = (dir / "later" / "explored.wkb").string();
    c.autosave_interval_s = 0.05;
    ExplorerEngine engine(c);
    engine.start();
    for (const auto& f : walk()) engine.add_fix(f);

    /* Several ticks fail while the directory is missing */
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(fs::exists(c.snapshot_path));

    fs::create_directories(dir / "later");
    for (int i = 0; i < 100 && !fs::exists(c.snapshot_path); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(fs::exists(c.snapshot_path));
    engine.stop();
}

/* The temp file is a symlink to /dev/full, so the write fails with ENOSPC.
 * A failed save removes the temp file, which clears the condition again. */
class DiskFullTest : public EngineTest {
protected:
    fs::path tmp_link;

    void SetUp() override {
        EngineTest::SetUp();
        if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
        tmp_link = dir / "explored.wkb.tmp";
        fs::create_symlink("/dev/full", tmp_link);
    }

    bool link_gone() const { return !fs::is_symlink(tmp_link); }

    EngineConfig autosave_config() const {
        EngineConfig c = config();
        c.autosave_interval_s = 0.05;
        return c;
    }
};

TEST_F(DiskFullTest, AutosaveKeepsRunningAfterDiskFull) {
    ExplorerEngine engine(autosave_config());
    engine.start();
    for (const auto& f : walk()) engine.add_fix(f);

    /* The error surfaces on a later add_fix */
    bool thrown = false;
    for (int i = 0; i < 200 && !thrown; i++) {
        try {
            engine.add_fix(0.0, 0.002, T0 + 6000 + i, 15.0);
        } catch (const std::system_error& e) {
            EXPECT_EQ(e.code().value(), ENOSPC);
            thrown = true;
        }
        if (!thrown) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(thrown);
    EXPECT_TRUE(link_gone());

    /* Space is back: the thread is still alive and writes the snapshot */
    const fs::path snap = dir / "explored.wkb";
    for (int i = 0; i < 100 && !fs::exists(snap); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(fs::exists(snap));
    engine.stop();
}

TEST_F(DiskFullTest, StopSavesBeforeReportingDiskFull) {
    ExplorerEngine engine(autosave_config());
    engine.start();
    for (const auto& f : walk()) engine.add_fix(f);
    const double area = engine.explored_area_meters();

    for (int i = 0; i < 200 && !link_gone(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(link_gone());

    /* The stored error is still reported, after the final save */
    EXPECT_THROW(engine.stop(), std::system_error);
    ASSERT_TRUE(fs::exists(dir / "explored.wkb"));

    ExplorerEngine again(config());
    EXPECT_EQ(again.start().load_status, LoadStatus::loaded);
    EXPECT_NEAR(again.explored_area_meters(), area, 1e-6);
}

TEST_F(EngineTest, InvalidConfigThrows) {
    EngineConfig c = config();
    c.default_buffer_m = -1.0;
    EXPECT_THROW(ExplorerEngine{c}, std::invalid_argument);
}

/* ========================================================================
 * Concurrency
 * ======================================================================== */

TEST_F(EngineTest, ReadersDuringWrites) {
    ExplorerEngine engine(config());
    engine.start();

    std::atomic<bool> done{false};
    std::atomic<int> reads{0};
    std::thread reader([&] {
        do {
            const auto gj = engine.to_geojson();
            if (gj["type"].get<std::string>() == "Polygon") reads++;
            engine.explored_area_meters();
        } while (!done);
    });

    std::vector<std::thread> producers;
    for (int p = 0; p < 3; p++) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < 20; i++) {
                engine.add_fix(0.1 * p, 0.0001 * i, T0 + i * 1000, 15.0);
            }
        });
    }
    for (auto& t : producers) t.join();
    done = true;
    reader.join();

    EXPECT_GT(reads.load(), 0);
    EXPECT_GT(engine.explored_area_meters(), 0.0);
}
