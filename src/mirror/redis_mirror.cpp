#include <signalhub/mirror/redis_mirror.hpp>

#include <signalhub/logger.h>

#include <stdexcept>
#include <string_view>

namespace signalhub
{

redis_endpoint parse_redis_url(const std::string& url)
{
    constexpr std::string_view scheme = "redis://";
    if (url.rfind(scheme, 0) != 0)
        throw std::invalid_argument("redis url must start with redis://: " + url);

    redis_endpoint endpoint;
    std::string rest = url.substr(scheme.size());

    if (auto at = rest.rfind('@'); at != std::string::npos)
    {
        auto credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        if (auto colon = credentials.find(':'); colon != std::string::npos)
        {
            endpoint.username = credentials.substr(0, colon);
            endpoint.password = credentials.substr(colon + 1);
        }
        else
        {
            endpoint.password = credentials;
        }
    }

    if (auto slash = rest.find('/'); slash != std::string::npos)
    {
        auto db = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
        if (!db.empty())
            endpoint.database = std::stoi(db);
    }

    if (auto colon = rest.rfind(':'); colon != std::string::npos)
    {
        auto port = std::stoi(rest.substr(colon + 1));
        if (port <= 0 || port > 65535)
            throw std::invalid_argument("redis port out of range: " + url);
        endpoint.port = static_cast<uint16_t>(port);
        rest = rest.substr(0, colon);
    }

    if (!rest.empty())
        endpoint.host = rest;
    return endpoint;
}

std::string resp::encode_command(const std::vector<std::string>& args)
{
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args)
    {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

// ============================================================================
// redis_mirror
// ============================================================================

redis_mirror::redis_mirror(redis_endpoint endpoint, std::chrono::milliseconds timeout)
    : socket_(io_context_)
    , endpoint_(std::move(endpoint))
    , timeout_(timeout)
{
}

redis_mirror::~redis_mirror()
{
    disconnect();
}

void redis_mirror::save(const mirror_record& record)
{
    command({"HSET", collection_name(record.kind), record.id, record.body.dump()});
}

std::optional<nlohmann::json> redis_mirror::load(record_kind kind, const std::string& id)
{
    auto reply = command({"HGET", collection_name(kind), id});
    if (reply.kind == resp::value::type::nil)
        return std::nullopt;

    try
    {
        return nlohmann::json::parse(reply.text);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw mirror_error("corrupt mirrored record " + id + ": " + e.what());
    }
}

std::vector<mirror_record> redis_mirror::load_all(record_kind kind)
{
    auto reply = command({"HGETALL", collection_name(kind)});

    std::vector<mirror_record> records;
    for (size_t i = 0; i + 1 < reply.elements.size(); i += 2)
    {
        const auto& id = reply.elements[i].text;
        try
        {
            records.push_back({kind, id, nlohmann::json::parse(reply.elements[i + 1].text)});
        }
        catch (const nlohmann::json::parse_error& e)
        {
            log_warning("skipping corrupt mirrored {} record {}: {}", collection_name(kind), id, e.what());
        }
    }
    return records;
}

void redis_mirror::erase(record_kind kind, const std::string& id)
{
    command({"HDEL", collection_name(kind), id});
}

bool redis_mirror::is_connected()
{
    try
    {
        auto reply = command({"PING"});
        return reply.kind == resp::value::type::simple && reply.text == "PONG";
    }
    catch (const mirror_error& e)
    {
        log_debug("redis ping failed: {}", e.what());
        return false;
    }
}

resp::value redis_mirror::command(const std::vector<std::string>& args)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return command_locked(args);
}

resp::value redis_mirror::command_locked(const std::vector<std::string>& args)
{
    if (args.empty())
        throw std::invalid_argument("empty redis command");

    ensure_connected();

    auto payload = resp::encode_command(args);
    boost::system::error_code ec;
    boost::asio::async_write(socket_, boost::asio::buffer(payload),
                             [&ec](const boost::system::error_code& result, size_t) { ec = result; });
    run("write");
    if (ec)
    {
        disconnect();
        throw mirror_error("redis write failed: " + ec.message());
    }

    auto reply = read_value();
    if (reply.kind == resp::value::type::error)
        throw mirror_error("redis " + args.front() + " failed: " + reply.text);
    return reply;
}

void redis_mirror::ensure_connected()
{
    if (connected_)
        return;

    // getaddrinfo cannot be cancelled, so a name is looked up once and reused
    if (endpoints_.empty())
    {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(endpoint_.host, ec);
        if (!ec)
        {
            endpoints_.emplace_back(address, endpoint_.port);
        }
        else
        {
            boost::asio::ip::tcp::resolver resolver(io_context_);
            for (const auto& entry : resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), ec))
                endpoints_.push_back(entry.endpoint());
            if (ec || endpoints_.empty())
            {
                endpoints_.clear();
                throw mirror_error("redis resolve " + endpoint_.host + " failed: " + ec.message());
            }
        }
    }

    boost::system::error_code ec;
    boost::asio::async_connect(socket_, endpoints_,
                               [&ec](const boost::system::error_code& result, const auto&) { ec = result; });
    run("connect");
    if (ec)
    {
        disconnect();
        throw mirror_error(fmt::format("redis connect to {}:{} failed: {}", endpoint_.host, endpoint_.port, ec.message()));
    }

    connected_ = true;
    read_buf_.consume(read_buf_.size());

    // A half-configured connection would write to the wrong database
    try
    {
        if (!endpoint_.password.empty())
        {
            if (endpoint_.username.empty())
                command_locked({"AUTH", endpoint_.password});
            else
                command_locked({"AUTH", endpoint_.username, endpoint_.password});
        }

        if (endpoint_.database != 0)
            command_locked({"SELECT", std::to_string(endpoint_.database)});
    }
    catch (const mirror_error&)
    {
        disconnect();
        throw;
    }

    log_info("redis mirror connected to {}:{}", endpoint_.host, endpoint_.port);
}

void redis_mirror::disconnect()
{
    boost::system::error_code ec;
    socket_.close(ec);
    connected_ = false;
    read_buf_.consume(read_buf_.size());
}

// Runs queued async work for at most timeout_; a stalled operation closes the socket.
void redis_mirror::run(const char* what)
{
    io_context_.restart();
    io_context_.run_for(timeout_);

    if (!io_context_.stopped())
    {
        disconnect();
        io_context_.run();
        throw mirror_error(std::string{"redis "} + what + " timed out");
    }
}

std::string redis_mirror::read_line()
{
    boost::system::error_code ec;
    size_t length = 0;
    boost::asio::async_read_until(socket_, read_buf_, "\r\n",
                                  [&](const boost::system::error_code& result, size_t n) {
                                      ec = result;
                                      length = n;
                                  });
    run("read");
    if (ec)
    {
        disconnect();
        throw mirror_error("redis read failed: " + ec.message());
    }

    auto begin = boost::asio::buffers_begin(read_buf_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length - 2));
    read_buf_.consume(length);
    return line;
}

std::string redis_mirror::read_exact(size_t n)
{
    const size_t needed = n + 2;
    if (read_buf_.size() < needed)
    {
        boost::system::error_code ec;
        boost::asio::async_read(socket_, read_buf_, boost::asio::transfer_exactly(needed - read_buf_.size()),
                                [&ec](const boost::system::error_code& result, size_t) { ec = result; });
        run("read");
        if (ec)
        {
            disconnect();
            throw mirror_error("redis read failed: " + ec.message());
        }
    }

    auto begin = boost::asio::buffers_begin(read_buf_.data());
    std::string data(begin, begin + static_cast<std::ptrdiff_t>(n));
    read_buf_.consume(needed);
    return data;
}

resp::value redis_mirror::read_value()
{
    auto line = read_line();
    if (line.empty())
    {
        disconnect();
        throw mirror_error("redis sent an empty reply line");
    }

    resp::value v;
    const auto body = line.substr(1);
    try
    {
        switch (line[0])
        {
            case '+':
                v.kind = resp::value::type::simple;
                v.text = body;
                break;

            case '-':
                v.kind = resp::value::type::error;
                v.text = body;
                break;

            case ':':
                v.kind = resp::value::type::integer;
                v.integer = std::stoll(body);
                break;

            case '$':
            {
                auto length = std::stoll(body);
                if (length < 0)
                    break;
                v.kind = resp::value::type::bulk;
                v.text = read_exact(static_cast<size_t>(length));
                break;
            }

            case '*':
            {
                auto count = std::stoll(body);
                if (count < 0)
                    break;
                v.kind = resp::value::type::array;
                v.elements.reserve(static_cast<size_t>(count));
                for (long long i = 0; i < count; ++i)
                    v.elements.push_back(read_value());
                break;
            }

            default:
                disconnect();
                throw mirror_error("unexpected redis reply: " + line);
        }
    }
    catch (const std::logic_error& e)
    {
        // stoll failures
        disconnect();
        throw mirror_error("malformed redis reply '" + line + "': " + e.what());
    }
    return v;
}

} // namespace signalhub
