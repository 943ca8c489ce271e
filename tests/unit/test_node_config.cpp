#include "NodeConfig.h"
#include "Logger.h"
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace PinDrop;

void test_defaults() {
    std::cout << "Running test_defaults..." << std::endl;
    Config empty;
    auto node = NodeConfig::fromConfig(empty);
    assert(node.ok());
    assert(node->transferPort == 12345);
    assert(node->discoveryPort == 12346);
    assert(node->chunkSize == 64 * 1024);
    assert(node->broadcastAddress.empty());
    assert(!node->saveDirectory.empty());

    auto limits = node->limits();
    assert(limits.transferTimeout == std::chrono::seconds(300));
    assert(limits.connectTimeout == std::chrono::milliseconds(5000));
    assert(limits.handshakeTimeout == std::chrono::seconds(10));

    auto discovery = node->discoveryOptions();
    assert(discovery.port == 12346);
    assert(discovery.interval == std::chrono::milliseconds(3000));
    std::cout << "test_defaults passed." << std::endl;
}

void test_values_from_config() {
    std::cout << "Running test_values_from_config..." << std::endl;
    setenv("HOME", "/tmp/pindrop-home", 1);
    Config config;
    config.set("transfer_port", "4000");
    config.set("chunk_size", "1024");
    config.set("broadcast_address", "auto");
    config.set("save_directory", "~/inbox");
    config.set("log_level", "DEBUG");

    auto node = NodeConfig::fromConfig(config);
    assert(node.ok());
    assert(node->transferPort == 4000);
    assert(node->chunkSize == 1024);
    assert(node->broadcastAddress.empty());
    assert(node->saveDirectory == "/tmp/pindrop-home/inbox");
    assert(node->logLevel == "DEBUG");

    config.set("broadcast_address", "10.1.255.255");
    node = NodeConfig::fromConfig(config);
    assert(node.ok());
    assert(node->discoveryOptions().broadcastAddress == "10.1.255.255");
    std::cout << "test_values_from_config passed." << std::endl;
}

void test_invalid_values() {
    std::cout << "Running test_invalid_values..." << std::endl;
    auto rejects = [](const std::string& key, const std::string& value) {
        Config config;
        config.set(key, value);
        auto node = NodeConfig::fromConfig(config);
        assert(!node.ok());
        assert(node.error().code == pd::ErrorCode::InvalidConfig);
        assert(node.error().message.find(key) != std::string::npos);
    };

    rejects("transfer_port", "70000");
    rejects("transfer_port", "12ab");
    rejects("discovery_port", "-1");
    rejects("chunk_size", "10");
    rejects("chunk_size", "999999999");
    rejects("transfer_timeout_sec", "0");
    rejects("broadcast_address", "everyone");
    rejects("log_level", "loud");

    NodeConfig overridden;
    overridden.transferPort = 65536;
    assert(!overridden.validate().ok());
    std::cout << "test_invalid_values passed." << std::endl;
}

void test_ensure_config_file() {
    std::cout << "Running test_ensure_config_file..." << std::endl;
    namespace fs = std::filesystem;
    Logger::instance().setConsoleOutput(false);
    fs::path dir = fs::temp_directory_path() / "pindrop_test_cfg";
    fs::remove_all(dir);
    std::string path = (dir / "nested" / "pindrop.conf").string();

    assert(NodeConfig::ensureConfigFile(path).ok());
    assert(fs::exists(path));

    // The written template parses back into the defaults
    Config config;
    assert(config.loadFromFile(path));
    auto node = NodeConfig::fromConfig(config);
    assert(node.ok());
    assert(node->transferPort == 12345);
    assert(node->broadcastAddress.empty());

    // Existing files are left alone
    std::ofstream(path) << "transfer_port=5000\n";
    assert(NodeConfig::ensureConfigFile(path).ok());
    Config kept;
    assert(kept.loadFromFile(path));
    assert(kept.getInt("transfer_port") == 5000);

    fs::remove_all(dir);
    Logger::instance().setConsoleOutput(true);
    std::cout << "test_ensure_config_file passed." << std::endl;
}

int main() {
    try {
        test_defaults();
        test_values_from_config();
        test_invalid_values();
        test_ensure_config_file();
        std::cout << "All NodeConfig tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
