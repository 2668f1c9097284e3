#include <catch2/catch_test_macros.hpp>

#include <quarry/crypto/hasher.h>

#include <string>

using namespace quarry;
using namespace quarry::crypto;

TEST_CASE("SHA-256 known vectors", "[crypto]") {
    CHECK(SHA256Hasher::hash(std::string_view{}) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(SHA256Hasher::hash("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Streaming updates match a single update", "[crypto]") {
    const std::string text = "The quick brown fox jumps over the lazy dog";
    SHA256Hasher hasher;
    hasher.update(std::string_view(text).substr(0, 10));
    hasher.update(std::string_view(text).substr(10));
    const auto streamed = hasher.finalize();
    CHECK(streamed == SHA256Hasher::hash(text));

    // finalize() leaves the hasher ready for reuse
    hasher.update("abc");
    CHECK(hasher.finalize() == SHA256Hasher::hash("abc"));
}
