#include "PinCode.h"
#include <iostream>
#include <cassert>
#include <cctype>
#include <set>

using namespace PinDrop;

void test_generate_format() {
    std::cout << "Running test_generate_format..." << std::endl;
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto pin = PinCode::generate();
        assert(pin.ok());
        assert(pin->size() == 6);
        for (char c : *pin) {
            assert(std::isdigit(static_cast<unsigned char>(c)));
        }
        assert(PinCode::isValid(*pin));
        seen.insert(*pin);
    }
    // 200 draws from a million values; a handful of collisions at most
    assert(seen.size() > 190);
    std::cout << "test_generate_format passed." << std::endl;
}

void test_generate_keeps_leading_zeros() {
    std::cout << "Running test_generate_keeps_leading_zeros..." << std::endl;
    bool sawLeadingZero = false;
    for (int i = 0; i < 5000 && !sawLeadingZero; ++i) {
        auto pin = PinCode::generate();
        assert(pin.ok());
        assert(pin->size() == 6);
        sawLeadingZero = (*pin)[0] == '0';
    }
    assert(sawLeadingZero);
    std::cout << "test_generate_keeps_leading_zeros passed." << std::endl;
}

void test_is_valid() {
    std::cout << "Running test_is_valid..." << std::endl;
    assert(PinCode::isValid("000000"));
    assert(PinCode::isValid("123456"));
    assert(!PinCode::isValid(""));
    assert(!PinCode::isValid("12345"));
    assert(!PinCode::isValid("1234567"));
    assert(!PinCode::isValid("12a456"));
    assert(!PinCode::isValid("123 456"));
    assert(!PinCode::isValid("-12345"));
    std::cout << "test_is_valid passed." << std::endl;
}

void test_verify() {
    std::cout << "Running test_verify..." << std::endl;
    assert(PinCode::verify("123456", "123456"));
    assert(!PinCode::verify("123457", "123456"));
    assert(!PinCode::verify("023456", "123456"));
    assert(!PinCode::verify("12345", "123456"));
    assert(!PinCode::verify("1234567", "123456"));
    assert(!PinCode::verify("", "123456"));
    std::cout << "test_verify passed." << std::endl;
}

void test_format_and_normalize() {
    std::cout << "Running test_format_and_normalize..." << std::endl;
    assert(PinCode::format("123456") == "123 456");
    assert(PinCode::normalize("123 456") == "123456");
    assert(PinCode::normalize("123-456") == "123456");
    assert(PinCode::normalize(PinCode::format("007007")) == "007007");
    std::cout << "test_format_and_normalize passed." << std::endl;
}

void test_random_hex() {
    std::cout << "Running test_random_hex..." << std::endl;
    auto hex = PinCode::randomHex(8);
    assert(hex.ok());
    assert(hex->size() == 16);
    for (char c : *hex) {
        assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
    auto other = PinCode::randomHex(8);
    assert(other.ok());
    assert(*hex != *other);
    std::cout << "test_random_hex passed." << std::endl;
}

int main() {
    try {
        test_generate_format();
        test_generate_keeps_leading_zeros();
        test_is_valid();
        test_verify();
        test_format_and_normalize();
        test_random_hex();
        std::cout << "All PinCode tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
