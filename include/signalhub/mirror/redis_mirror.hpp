#pragma once

#include <signalhub/mirror/mirror_store.hpp>

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace signalhub
{

struct redis_endpoint
{
    std::string host{"localhost"};
    uint16_t port{6379};
    std::string username{};
    std::string password{};
    int database{0};
};

// redis://[[user]:password@]host[:port][/db]
redis_endpoint parse_redis_url(const std::string& url);

namespace resp
{

struct value
{
    enum class type { simple, error, integer, bulk, nil, array };

    type kind{type::nil};
    std::string text{};
    long long integer{0};
    std::vector<value> elements{};
};

// Serialise a command as a RESP array of bulk strings.
std::string encode_command(const std::vector<std::string>& args);

} // namespace resp

// ============================================================================
// Redis Mirror
// ============================================================================
//
// Mirrors records into the hashes "devices" and "sessions" (field = id,
// value = JSON). Calls are synchronous and bounded by `timeout`; a broken
// connection is dropped and re-dialled on the next call. Calls block, so the
// hub only ever sees this through a write_behind_mirror.

class redis_mirror : public mirror_store
{
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::streambuf read_buf_;
    redis_endpoint endpoint_;
    std::vector<boost::asio::ip::tcp::endpoint> endpoints_;
    std::chrono::milliseconds timeout_;
    std::mutex mutex_;
    bool connected_{false};

public:
    explicit redis_mirror(redis_endpoint endpoint,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{500});
    ~redis_mirror() override;

    redis_mirror(const redis_mirror&) = delete;
    redis_mirror& operator=(const redis_mirror&) = delete;

    void save(const mirror_record& record) override;
    std::optional<nlohmann::json> load(record_kind kind, const std::string& id) override;
    std::vector<mirror_record> load_all(record_kind kind) override;
    void erase(record_kind kind, const std::string& id) override;
    bool is_connected() override;
    std::string name() const override { return "redis"; }

    resp::value command(const std::vector<std::string>& args);

private:
    resp::value command_locked(const std::vector<std::string>& args);
    void ensure_connected();
    void disconnect();
    void run(const char* what);
    std::string read_line();
    std::string read_exact(size_t n);
    resp::value read_value();
};

} // namespace signalhub
