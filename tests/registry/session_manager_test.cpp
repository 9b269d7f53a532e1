#include <signalhub/registry/device_registry.hpp>
#include <signalhub/registry/session_manager.hpp>

#include "support/error_kind.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <set>

using namespace signalhub;
using namespace std::chrono_literals;
using test_support::error_kind_of;

namespace
{
// Hands out the scripted tokens in order, then falls back to random ones.
struct scripted_tokens
{
    std::shared_ptr<std::deque<std::string>> queue = std::make_shared<std::deque<std::string>>();

    std::string operator()() const
    {
        if (queue->empty())
            return random_session_token();
        auto next = queue->front();
        queue->pop_front();
        return next;
    }
};
} // namespace

class SessionManagerTest : public ::testing::Test
{
protected:
    manual_clock clock_;
    registry_store store_;
    memory_mirror mirror_;
    scripted_tokens tokens_;
    device_registry devices_{store_, clock_, registry_config{}};
    session_manager sessions_{store_, clock_, registry_config{}, tokens_};

    SessionManagerTest() { store_.set_mirror(&mirror_); }

    void SetUp() override
    {
        device_info server;
        server.capabilities = {"server"};
        devices_.register_device("tv", server);
        devices_.register_device("tv-2", server);
        devices_.register_device("phone", {});
    }
};

TEST_F(SessionManagerTest, CreateWithoutServerIsUnpaired)
{
    auto id = sessions_.create_session();
    auto s = sessions_.get_session(id);

    EXPECT_EQ(s.status, session_status::unpaired);
    EXPECT_FALSE(s.server_ref.has_value());
    EXPECT_EQ(s.created_at, clock_.now());
    EXPECT_TRUE(mirror_.load(record_kind::session, id).has_value());
}

TEST_F(SessionManagerTest, CreateWithServerIsHalfPaired)
{
    auto id = sessions_.create_session(std::string{"tv"});
    auto s = sessions_.get_session(id);

    EXPECT_EQ(s.status, session_status::half_paired);
    EXPECT_EQ(s.server_ref, "tv");
    EXPECT_EQ((*mirror_.load(record_kind::session, id))["status"], "half_paired");
}

TEST_F(SessionManagerTest, RandomTokensAreUnique)
{
    session_manager manager(store_, clock_, registry_config{});
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i)
        ids.insert(manager.create_session());
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(SessionManagerTest, TokenCollisionIsRetried)
{
    auto first = sessions_.create_session();
    tokens_.queue->assign({first, first, "fresh-token"});

    EXPECT_EQ(sessions_.create_session(), "fresh-token");
    EXPECT_EQ(sessions_.list_sessions().size(), 2u);
}

TEST_F(SessionManagerTest, PersistentCollisionIsInternalFault)
{
    auto first = sessions_.create_session();
    tokens_.queue->assign(session_manager::max_token_attempts, first);

    EXPECT_EQ(error_kind_of([&] { sessions_.create_session(); }), error_kind::internal_fault);
    EXPECT_EQ(sessions_.list_sessions().size(), 1u);
}

TEST_F(SessionManagerTest, CreateWithUnusableServerLeavesNoSession)
{
    tokens_.queue->assign({"doomed-1", "doomed-2"});

    EXPECT_EQ(error_kind_of([&] { sessions_.create_session(std::string{"ghost"}); }), error_kind::not_found);
    EXPECT_EQ(error_kind_of([&] { sessions_.create_session(std::string{"phone"}); }),
              error_kind::validation_error);

    EXPECT_TRUE(sessions_.list_sessions().empty());
    EXPECT_FALSE(mirror_.load(record_kind::session, "doomed-1").has_value());
    EXPECT_EQ(error_kind_of([&] { sessions_.get_session("doomed-1"); }), error_kind::not_found);
}

TEST_F(SessionManagerTest, EmptyServerIdIsRejected)
{
    EXPECT_EQ(error_kind_of([&] { sessions_.create_session(std::string{}); }), error_kind::validation_error);
}

TEST_F(SessionManagerTest, GetUnknownSessionIsNotFound)
{
    EXPECT_EQ(error_kind_of([&] { sessions_.get_session("nope"); }), error_kind::not_found);
}

TEST_F(SessionManagerTest, AvailableSessionsAreJoinableOldestFirst)
{
    auto late = sessions_.create_session(std::string{"tv-2"});
    clock_.set(clock_.now() - 10s);
    auto early = sessions_.create_session(std::string{"tv"});
    clock_.advance(20s);

    sessions_.create_session();
    auto unpaired_with_client = sessions_.create_session();
    sessions_.bind_client(unpaired_with_client, "phone");

    auto available = sessions_.list_available_sessions();
    ASSERT_EQ(available.size(), 2u);
    EXPECT_EQ(available[0].id, early);
    EXPECT_EQ(available[1].id, late);
}

TEST_F(SessionManagerTest, FullLifecycle)
{
    auto id = sessions_.create_session(std::string{"tv"});
    EXPECT_EQ(sessions_.bind_client(id, "phone").status, session_status::paired);

    auto started = sessions_.start_session(id, std::string{"phone"});
    EXPECT_TRUE(started.changed);
    EXPECT_EQ(started.record.status, session_status::active);

    auto ended = sessions_.end_session(id, std::string{"tv"});
    EXPECT_TRUE(ended.changed);
    EXPECT_EQ(ended.record.status, session_status::ended);
    EXPECT_FALSE(sessions_.end_session(id).changed);

    EXPECT_EQ((*mirror_.load(record_kind::session, id))["status"], "ended");
}

TEST_F(SessionManagerTest, TransitionsRequireMembership)
{
    auto id = sessions_.create_session(std::string{"tv"});
    sessions_.bind_client(id, "phone");

    EXPECT_EQ(error_kind_of([&] { sessions_.start_session(id, std::string{"tv-2"}); }), error_kind::not_a_member);
    EXPECT_EQ(error_kind_of([&] { sessions_.end_session(id, std::string{"tv-2"}); }), error_kind::not_a_member);
    EXPECT_EQ(sessions_.get_session(id).status, session_status::paired);
}

TEST_F(SessionManagerTest, BindRequiresIds)
{
    EXPECT_EQ(error_kind_of([&] { sessions_.bind_client("", "phone"); }), error_kind::validation_error);
    EXPECT_EQ(error_kind_of([&] { sessions_.bind_server("x", ""); }), error_kind::validation_error);
}

TEST_F(SessionManagerTest, EndSessionsOfMirrorsEveryEndedSession)
{
    auto id = sessions_.create_session(std::string{"tv"});
    sessions_.bind_client(id, "phone");

    auto ended = sessions_.end_sessions_of("phone");
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ((*mirror_.load(record_kind::session, id))["status"], "ended");
}
