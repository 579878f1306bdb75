#undef NDEBUG
#include <cassert>
#include <iostream>

#include "infrastructure/Base64.hpp"

using marklens::infrastructure::Base64;

int main() {
    std::cout << "[Test] Starting Base64 Test..." << std::endl;

    assert(Base64::Encode("") == "");
    assert(Base64::Encode("f") == "Zg==");
    assert(Base64::Encode("fo") == "Zm8=");
    assert(Base64::Encode("foo") == "Zm9v");
    assert(Base64::Encode(std::string("\x00\xFF\x10", 3)) == "AP8Q");

    auto decoded = Base64::Decode("Zm9v\nYmFy");
    assert(decoded && *decoded == "foobar");
    assert(!Base64::Decode("Zm9v!"));
    assert(!Base64::Decode("Zg=x"));
    assert(!Base64::Decode("Z"));

    // Data URI form used for embedded images.
    auto uri = Base64::DecodeDataUri("data:image/png;base64,iVBORw==");
    assert(uri);
    assert(uri->mimeType == "image/png");
    assert(uri->data == std::string("\x89PNG", 4));

    auto bare = Base64::DecodeDataUri("Zm9v");
    assert(bare && bare->mimeType.empty() && bare->data == "foo");

    assert(!Base64::DecodeDataUri("data:image/png,notbase64"));
    assert(!Base64::DecodeDataUri("data:image/png;base64"));

    std::cout << "[PASS] Base64 Test." << std::endl;
    return 0;
}
