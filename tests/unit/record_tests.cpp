#include <doctest/doctest.h>
#include <navstack/record.hpp>

#include <cctype>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

using namespace navstack;

namespace {

// A caller-defined record type; the stack only needs key() and destination()
struct TaggedRecord {
    std::string id;
    int target;

    const std::string& key() const { return id; }
    int destination() const { return target; }
};

struct NoKey {
    int destination() const { return 0; }
};

struct NonStringKey {
    std::vector<int> key() const { return {}; }
    int destination() const { return 0; }
};

} // namespace

TEST_CASE("is_record accepts types exposing key and destination") {
    CHECK(is_record_v<BasicRecord<std::string>>);
    CHECK(is_record_v<TaggedRecord>);
    CHECK_FALSE(is_record_v<NoKey>);
    CHECK_FALSE(is_record_v<NonStringKey>);
    CHECK_FALSE(is_record_v<int>);
}

TEST_CASE("record_traits exposes the destination type") {
    CHECK((std::is_same_v<record_traits<TaggedRecord>::destination_type, int>));
    CHECK((std::is_same_v<record_traits<BasicRecord<std::string>>::destination_type, std::string>));
}

TEST_CASE("BasicRecord keeps caller-supplied key") {
    BasicRecord<std::string> record("home-1", "home");
    CHECK(record.key() == "home-1");
    CHECK(record.destination() == "home");
}

TEST_CASE("BasicRecord mints a key when none is given") {
    BasicRecord<std::string> a(std::string("home"));
    BasicRecord<std::string> b(std::string("home"));

    CHECK_FALSE(a.key().empty());
    CHECK(a.destination() == b.destination());
    CHECK(a.key() != b.key());
    CHECK(a != b);
}

TEST_CASE("generate_record_key produces UUID v4 strings") {
    std::string key = generate_record_key();

    REQUIRE(key.size() == 36);
    CHECK(key[8] == '-');
    CHECK(key[13] == '-');
    CHECK(key[18] == '-');
    CHECK(key[23] == '-');
    CHECK(key[14] == '4');

    char variant = key[19];
    CHECK((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));

    for (size_t i = 0; i < key.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        CHECK(std::isxdigit(static_cast<unsigned char>(key[i])));
    }
}

TEST_CASE("generate_record_key does not repeat") {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 10000; ++i) {
        auto inserted = seen.insert(generate_record_key()).second;
        REQUIRE(inserted);
    }
    CHECK(seen.size() == 10000);
}
