#include "speckle_track/core/errors.hpp"
#include "speckle_track/core/events.hpp"
#include "speckle_track/core/parallel.hpp"
#include "speckle_track/core/utils.hpp"

#include <atomic>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace core = speckle_track::core;

TEST_CASE("parallel_for_visits_every_index_once") {
    const size_t n = 257;
    std::vector<std::atomic<int>> hits(n);
    for (auto& h : hits) h.store(0);

    core::parallel_for(n, 4, [&](size_t i) { hits[i].fetch_add(1); });

    for (size_t i = 0; i < n; ++i) {
        REQUIRE(hits[i].load() == 1);
    }
}

TEST_CASE("parallel_for_rethrows_worker_exception_on_caller") {
    REQUIRE_THROWS_AS(core::parallel_for(100, 4,
                                         [](size_t i) {
                                             if (i == 37) throw std::runtime_error("boom");
                                         }),
                      std::runtime_error);
}

TEST_CASE("parallel_for_static_partitions_are_contiguous_and_cover_range") {
    const size_t n = 10;
    const int workers = 3;
    const int parts = core::static_partition_count(n, workers);
    std::vector<std::pair<size_t, size_t>> ranges(static_cast<size_t>(parts), {0, 0});

    core::parallel_for_static(n, workers, [&](int w, size_t begin, size_t end) {
        ranges[static_cast<size_t>(w)] = {begin, end};
    });

    size_t expected_begin = 0;
    for (const auto& r : ranges) {
        REQUIRE(r.first == expected_begin);
        REQUIRE(r.second > r.first);
        expected_begin = r.second;
    }
    REQUIRE(expected_begin == n);
}

TEST_CASE("compute_worker_count_never_exceeds_task_count") {
    REQUIRE(core::compute_worker_count(8, 2) <= 2);
    REQUIRE(core::compute_worker_count(0, 100) == 1);
}

TEST_CASE("median_of_handles_odd_and_even_sizes") {
    std::vector<double> odd{5.0, 1.0, 3.0};
    std::vector<double> even{4.0, 1.0, 3.0, 2.0};
    REQUIRE(core::median_of(odd) == Catch::Approx(3.0));
    REQUIRE(core::median_of(even) == Catch::Approx(2.5));
}

TEST_CASE("percentile_of_interpolates_between_ranks") {
    std::vector<double> v{0.0, 10.0, 20.0, 30.0, 40.0};
    REQUIRE(core::percentile_of(v, 0.0) == Catch::Approx(0.0));
    REQUIRE(core::percentile_of(v, 50.0) == Catch::Approx(20.0));
    REQUIRE(core::percentile_of(v, 90.0) == Catch::Approx(36.0));
    REQUIRE(core::percentile_of(v, 100.0) == Catch::Approx(40.0));
}

TEST_CASE("sha256_bytes_matches_known_digest") {
    const std::string s = "abc";
    std::vector<uint8_t> bytes(s.begin(), s.end());
    REQUIRE(core::sha256_bytes(bytes) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
    core::EventEmitter emitter;
    std::ostringstream out;
    emitter.phase_start("run1", speckle_track::Phase::ITERATION, out);
    emitter.phase_progress("run1", speckle_track::Phase::ITERATION, 2, 5, "iteration",
                           {{"error", 1.5}}, out);

    std::istringstream in(out.str());
    std::string line;
    std::vector<core::json> events;
    while (std::getline(in, line)) {
        events.push_back(core::json::parse(line));
    }
    REQUIRE(events.size() == 2);
    REQUIRE(events[0]["type"] == "phase_start");
    REQUIRE(events[0]["phase_name"] == "ITERATION");
    REQUIRE(events[1]["type"] == "phase_progress");
    REQUIRE(events[1]["current"] == 2);
    REQUIRE(events[1]["error"].get<double>() == Catch::Approx(1.5));
    REQUIRE(events[1]["run_id"] == "run1");
}

TEST_CASE("event_emitter_numbers_records_and_times_phases") {
    core::EventEmitter emitter;
    std::ostringstream out;
    emitter.run_start("run2", {{"n_iter", 3}, {"type", "ignored"}}, out);
    emitter.phase_start("run2", speckle_track::Phase::MASK, out);
    emitter.phase_end("run2", speckle_track::Phase::MASK, "ok", {{"valid_pixels", 10}}, out);
    emitter.phase_end("run2", speckle_track::Phase::WHITEFIELD, "skipped", core::json::object(),
                      out);
    REQUIRE(emitter.events_written() == 4);

    std::istringstream in(out.str());
    std::string line;
    std::vector<core::json> events;
    while (std::getline(in, line)) {
        events.push_back(core::json::parse(line));
    }
    REQUIRE(events.size() == 4);
    REQUIRE(events[0]["type"] == "run_start");
    REQUIRE(events[0]["n_iter"] == 3);
    REQUIRE(events[0]["seq"] == 0);
    REQUIRE(events[2]["seq"] == 2);
    REQUIRE(events[2]["valid_pixels"] == 10);
    REQUIRE(events[2]["elapsed_s"].get<double>() >= 0.0);
    REQUIRE_FALSE(events[3].contains("elapsed_s"));
}

TEST_CASE("write_text_and_sha256_file_agree_with_in_memory_digest") {
    const auto path = std::filesystem::temp_directory_path() / "speckle_track_test_hash.txt";
    core::write_text(path, "abc");
    REQUIRE_FALSE(std::filesystem::exists(std::filesystem::path(path.string() + ".tmp")));
    REQUIRE(core::sha256_file(path) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(core::sha256_file(path), speckle_track::IOError);
}

TEST_CASE("run_id_is_prefixed_and_unique") {
    const std::string a = core::get_run_id();
    const std::string b = core::get_run_id();
    REQUIRE(a.rfind("st_", 0) == 0);
    REQUIRE(a.size() == b.size());
    REQUIRE(a != b);
}
