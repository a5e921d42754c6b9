#ifndef CAMSYNC_TESTS_TEST_FIXTURES_H
#define CAMSYNC_TESTS_TEST_FIXTURES_H

#include <string>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/Endpoints.h"

namespace CamSync {
namespace Testing {

constexpr const char* REGION_BASE = "https://rest-test.immedia-semi.com";

/**
 * Login response for region "test" with networks 1234 (onboarded) and
 * 5678 (not onboarded)
 */
inline std::string loginBody(const std::string& token = "token-1") {
    nlohmann::json body = {
        {"authtoken", {{"authtoken", token}, {"message", "auth"}}},
        {"region", {{"test", "Testland"}}},
        {"networks", {
            {"1234", {{"name", "Home"}, {"onboarded", true}}},
            {"5678", {{"name", "Cabin"}, {"onboarded", false}}}
        }}
    };
    return body.dump();
}

inline nlohmann::json camera(int id, const std::string& name, int networkId,
                             const std::string& thumbnail = "") {
    return {
        {"id", id},
        {"name", name},
        {"network_id", networkId},
        {"serial", "SN" + std::to_string(id)},
        {"enabled", true},
        {"battery", "ok"},
        {"temperature", 68},
        {"thumbnail", thumbnail}
    };
}

/**
 * Scratch directory removed on destruction
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("camsync_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return m_path.string(); }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};

} // namespace Testing
} // namespace CamSync

#endif // CAMSYNC_TESTS_TEST_FIXTURES_H
