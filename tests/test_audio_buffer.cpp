// Tests for AudioBuffer, LevelMeter and SessionStore

#include "audio_buffer.hpp"
#include "level_meter.hpp"
#include "session_store.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace sobotta;

void test_append_take() {
    std::cout << "Testing append/take..." << std::endl;

    AudioBuffer buffer;
    assert(buffer.sample_rate() == 0 && buffer.channels() == 0 && "Placeholder format");

    const float chunk[] = {0.1f, 0.2f, 0.3f};
    buffer.append(chunk, 3);
    buffer.append(chunk, 2);
    assert(buffer.size() == 5);

    auto taken = buffer.take();
    assert(taken.size() == 5);
    assert(taken[3] == 0.1f && taken[4] == 0.2f);
    assert(buffer.size() == 0 && "take leaves the buffer empty");
    assert(buffer.take().empty());

    buffer.append(chunk, 3);
    buffer.clear();
    assert(buffer.size() == 0);

    std::cout << "  PASS: append/take/clear" << std::endl;
}

void test_shared_storage() {
    std::cout << "Testing shared storage..." << std::endl;

    AudioBuffer placeholder;
    AudioBuffer writer = placeholder;
    AudioBuffer formatted = placeholder.with_format(48000, 2);

    assert(formatted.sample_rate() == 48000 && formatted.channels() == 2);
    assert(placeholder.sample_rate() == 0 && "Original metadata untouched");
    assert(formatted.shares_storage_with(writer));
    assert(!formatted.shares_storage_with(AudioBuffer()));

    const float chunk[] = {0.5f, -0.5f};
    writer.append(chunk, 2);
    assert(formatted.size() == 2 && "Writes through a copy are visible");

    auto tail = formatted.tail(1);
    assert(tail.size() == 1 && tail[0] == -0.5f);
    assert(formatted.tail(10).size() == 2 && "Tail is bounded by what exists");

    std::cout << "  PASS: Copies share one storage" << std::endl;
}

void test_concurrent_writer() {
    std::cout << "Testing concurrent append and take..." << std::endl;

    AudioBuffer buffer;
    AudioBuffer writer = buffer;
    std::atomic<bool> done{false};
    const size_t chunks = 2000;
    const size_t chunk_size = 64;

    std::thread producer([&]() {
        std::vector<float> chunk(chunk_size, 0.25f);
        for (size_t i = 0; i < chunks; ++i) {
            writer.append(chunk.data(), chunk.size());
        }
        done.store(true);
    });

    // Concurrent readers never see a torn chunk
    while (!done.load()) {
        assert(buffer.size() % chunk_size == 0);
        (void)buffer.tail(256);
    }
    producer.join();

    assert(buffer.take().size() == chunks * chunk_size && "No samples lost");

    std::cout << "  PASS: No lost samples under concurrent reads" << std::endl;
}

void test_level_meter() {
    std::cout << "Testing level meter..." << std::endl;

    AudioBuffer buffer(16000, 1);
    std::vector<float> quiet(4096, 0.0f);
    std::vector<float> loud(2048, 0.5f);
    buffer.append(quiet.data(), quiet.size());
    buffer.append(loud.data(), loud.size());

    std::mutex mutex;
    std::vector<float> levels;
    LevelMeter meter(buffer, [&](float level) {
        std::lock_guard<std::mutex> lock(mutex);
        levels.push_back(level);
    }, std::chrono::milliseconds(5), 2048);

    meter.start();
    assert(meter.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    auto before = std::chrono::steady_clock::now();
    meter.stop();
    auto waited = std::chrono::steady_clock::now() - before;
    assert(!meter.is_running());
    assert(waited < std::chrono::milliseconds(50) && "Stop does not wait out an interval");

    std::lock_guard<std::mutex> lock(mutex);
    assert(!levels.empty());
    for (float level : levels) {
        // Only the trailing window of 0.5 is measured
        assert(level > 0.49f && level < 0.51f);
    }
    assert(buffer.size() == 6144 && "Meter never mutates the buffer");

    std::cout << "  PASS: Level meter reads the trailing window" << std::endl;
}

void test_session_store() {
    std::cout << "Testing session store..." << std::endl;

    SessionStore store;
    assert(store.get("missing") == nullptr);

    store.insert("a", {0.1f, 0.2f});
    assert(store.contains("a") && store.size() == 1);

    auto first = store.get("a");
    auto second = store.get("a");
    assert(first && second && *first == *second && "Repeated reads are identical");

    assert(store.remove("a"));
    assert(!store.remove("a"));
    assert(!store.contains("a"));
    assert(first->size() == 2 && "Readers keep their copy after removal");

    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_session_id();
        assert(id.size() == 36 && id[14] == '4' && "UUID v4 layout");
        ids.insert(id);
    }
    assert(ids.size() == 100 && "Session ids are unique");

    std::cout << "  PASS: Session store" << std::endl;
}

int main() {
    std::cout << "\n=== Audio Buffer Test Suite ===" << std::endl << std::endl;

    test_append_take();
    test_shared_storage();
    test_concurrent_writer();
    test_level_meter();
    test_session_store();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
