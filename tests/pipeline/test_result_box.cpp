/**
 * test_result_box.cpp - Single delivery of the latest result and the transcript log
 */

// assert() is the checking mechanism, keep it in every build type
#undef NDEBUG

#include "pipeline/result_box.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

static TranscriptEntry text_entry(const std::string& t) {
    TranscriptEntry e;
    e.text = t;
    return e;
}

void test_take_last_once() {
    ResultBox box;
    std::string before = box.takeLast();
    assert(before.empty());

    box.publish(text_entry("hello"));
    std::string first = box.takeLast();
    std::string second = box.takeLast();
    assert(first == "hello");
    assert(second.empty());
    assert(box.size() == 1);

    std::cout << "[PASS] test_take_last_once" << std::endl;
}

void test_newest_wins() {
    ResultBox box;
    box.publish(text_entry("one"));
    box.publish(text_entry("two"));
    std::string newest = box.takeLast();
    std::string again = box.takeLast();
    assert(newest == "two");
    assert(again.empty());

    box.publish(text_entry("three"));
    newest = box.takeLast();
    assert(newest == "three");

    auto texts = box.texts();
    assert(texts.size() == 3);
    assert(texts[0] == "one" && texts[1] == "two" && texts[2] == "three");

    std::cout << "[PASS] test_newest_wins" << std::endl;
}

void test_snapshot_keeps_timestamps() {
    ResultBox box;
    TranscriptEntry e;
    e.start = 0.0;
    e.end = 1.2;
    e.text = "hello";
    box.publish(e);

    auto snap = box.snapshot();
    assert(snap.size() == 1);
    assert(snap[0].end == 1.2);
    assert(snap[0].text == "hello");

    // Reading does not shrink the transcript
    box.takeLast();
    assert(box.snapshot().size() == 1);

    std::cout << "[PASS] test_snapshot_keeps_timestamps" << std::endl;
}

void test_concurrent_publish() {
    ResultBox box;
    const int n = 500;

    std::thread writer([&]() {
        for (int i = 0; i < n; ++i) box.publish(text_entry(std::to_string(i)));
    });

    size_t lastSize = 0;
    int delivered = 0;
    while (box.size() < (size_t)n) {
        size_t s = box.size();
        assert(s >= lastSize);
        lastSize = s;
        if (!box.takeLast().empty()) delivered++;
    }
    writer.join();

    assert(box.size() == (size_t)n);
    assert(delivered <= n);

    std::cout << "[PASS] test_concurrent_publish (delivered=" << delivered << ")" << std::endl;
}

// A failing check must fail the test program, whatever the build type
void test_failed_check_aborts() {
#ifdef NDEBUG
    std::cerr << "[FAIL] assert() disabled in this build" << std::endl;
    std::exit(1);
#endif
    std::cout << "[PASS] test_failed_check_aborts" << std::endl;
}

int main() {
    std::cout << "=== ResultBox Tests ===" << std::endl;

    test_failed_check_aborts();

    test_take_last_once();
    test_newest_wins();
    test_snapshot_keeps_timestamps();
    test_concurrent_publish();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
