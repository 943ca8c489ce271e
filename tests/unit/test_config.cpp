#include "Config.h"
#include "Logger.h"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace PinDrop;

void test_basic_operations() {
    std::cout << "Running test_basic_operations..." << std::endl;
    Config config;

    config.set("key1", "value1");
    assert(config.get("key1") == "value1");
    assert(config.hasKey("key1"));
    assert(!config.hasKey("key2"));
    assert(config.get("key2", "fallback") == "fallback");

    config.set("port", "42");
    assert(config.getInt("port") == 42);
    config.set("flag", "yes");
    assert(config.getBool("flag") == true);
    config.set("chunk", "65536");
    assert(config.getSize("chunk") == 65536);

    std::cout << "test_basic_operations passed." << std::endl;
}

void test_numeric_parsing_rejects_garbage() {
    std::cout << "Running test_numeric_parsing_rejects_garbage..." << std::endl;
    Config config;

    config.set("port", "12345abc");
    assert(config.getInt("port", 7) == 7);

    config.set("chunk", "-1");
    assert(config.getSize("chunk", 99) == 99);

    config.set("flag", "maybe");
    assert(config.getBool("flag", true) == true);
    config.set("flag", "OFF");
    assert(config.getBool("flag", true) == false);

    std::cout << "test_numeric_parsing_rejects_garbage passed." << std::endl;
}

void test_parse_stream() {
    std::cout << "Running test_parse_stream..." << std::endl;
    Logger::instance().setConsoleOutput(false);

    std::istringstream in(
        "# a comment\n"
        "\n"
        "   transfer_port =  4000  \n"
        "not a setting\n"
        "=orphan value\n"
        "save_directory=/tmp/in box\n"
        "transfer_port=4001\n");

    Config config;
    size_t count = config.parse(in, "inline");
    assert(count == 2);
    assert(config.getInt("transfer_port") == 4001);
    assert(config.get("save_directory") == "/tmp/in box");
    assert(config.keys().size() == 2);
    assert(config.keys()[0] == "save_directory");

    Logger::instance().setConsoleOutput(true);
    std::cout << "test_parse_stream passed." << std::endl;
}

void test_file_loading() {
    std::cout << "Running test_file_loading..." << std::endl;
    std::string testFile = (std::filesystem::temp_directory_path() / "pindrop_test_config.conf").string();
    {
        std::ofstream out(testFile);
        out << "transfer_port=12345\n";
        out << "log_level=debug\n";
    }

    Config config;
    assert(config.loadFromFile(testFile));
    assert(config.get("transfer_port") == "12345");
    assert(config.get("log_level") == "debug");

    std::filesystem::remove(testFile);
    assert(!config.loadFromFile(testFile));
    // A failed load leaves earlier settings alone
    assert(config.get("log_level") == "debug");
    std::cout << "test_file_loading passed." << std::endl;
}

void test_validation() {
    std::cout << "Running test_validation..." << std::endl;
    Config config;
    config.set("port", "8080");
    config.set("host", "localhost");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["port"] = [](const std::string&, const std::string& v) {
        try {
            int port = std::stoi(v);
            return port > 0 && port < 65536;
        } catch (const std::exception&) {
            return false;
        }
    };

    assert(config.validate(schema).ok());
    auto unknown = config.unknownKeys(schema);
    assert(unknown.size() == 1);
    assert(unknown[0] == "host");

    config.set("port", "70000"); // Invalid port
    auto result = config.validate(schema);
    assert(!result.ok());
    assert(result.error().code == pd::ErrorCode::InvalidConfig);
    assert(result.error().message.find("port") != std::string::npos);

    std::cout << "test_validation passed." << std::endl;
}

int main() {
    try {
        test_basic_operations();
        test_numeric_parsing_rejects_garbage();
        test_parse_stream();
        test_file_loading();
        test_validation();
        std::cout << "All Config tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
