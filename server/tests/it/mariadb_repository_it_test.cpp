#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "sent/db_client.hpp"
#include "sent/mariadb_chat_repository.hpp"

namespace {

sent::DbConfig TestDbConfig() {
  sent::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "chat_db";
  return cfg;
}

bool DatabaseReachable(const sent::DbConfig& cfg) {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    return false;
  }
  unsigned int timeout = 2;
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  bool ok = mysql_real_connect(conn, cfg.host.c_str(), cfg.user.c_str(), cfg.password.c_str(), cfg.database.c_str(),
                               cfg.port, nullptr, 0) != nullptr &&
            mysql_query(conn, "SELECT 1 FROM messages LIMIT 1;") == 0;
  if (ok) {
    MYSQL_RES* res = mysql_store_result(conn);
    if (res) {
      mysql_free_result(res);
    }
  }
  mysql_close(conn);
  return ok;
}

class MariaDbRepositoryItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cfg = TestDbConfig();
    if (!DatabaseReachable(cfg)) {
      GTEST_SKIP() << "MariaDB에 연결할 수 없어 건너뜀 (server/db/schema.sql 적용 필요)";
    }
    db_client_ = std::make_shared<sent::MariaDbClient>(cfg);
    repository_ = std::make_unique<sent::MariaDbChatRepository>(db_client_);
    room_id_ = "it-" + sent::GenerateUuid();
  }

  std::shared_ptr<sent::MariaDbClient> db_client_;
  std::unique_ptr<sent::MariaDbChatRepository> repository_;
  std::string room_id_;
  sent::Identity alice_{"it-alice", "Alice", "a.png"};
  sent::Identity bob_{"it-bob", "Bob", ""};
};

TEST_F(MariaDbRepositoryItTest, StoredMessagesComeBackOldestFirst) {
  auto first = repository_->CreateMessage(room_id_, alice_, "first");
  auto second = repository_->CreateMessage(room_id_, bob_, "second");
  auto third = repository_->CreateMessage(room_id_, alice_, "third");

  auto messages = repository_->ListMessages(room_id_, 10, 0);
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[0].id, first.id);
  EXPECT_EQ(messages[1].id, second.id);
  EXPECT_EQ(messages[2].id, third.id);
  EXPECT_EQ(messages[1].user_name, "Bob");
  EXPECT_EQ(messages[0].user_avatar, "a.png");
  EXPECT_EQ(messages[2].created_at, third.created_at);
}

TEST_F(MariaDbRepositoryItTest, BurstInSameMillisecondKeepsInsertOrder) {
  std::vector<std::string> ids;
  for (int i = 0; i < 20; ++i) {
    ids.push_back(repository_->CreateMessage(room_id_, alice_, "burst-" + std::to_string(i)).id);
  }

  auto messages = repository_->ListMessages(room_id_, 50, 0);
  ASSERT_EQ(messages.size(), ids.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(messages[i].id, ids[i]);
  }
}

TEST_F(MariaDbRepositoryItTest, PageReturnsNewestMessages) {
  for (int i = 0; i < 5; ++i) {
    repository_->CreateMessage(room_id_, alice_, "m" + std::to_string(i));
  }
  auto page = repository_->ListMessages(room_id_, 2, 0);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].content, "m3");
  EXPECT_EQ(page[1].content, "m4");

  auto older = repository_->ListMessages(room_id_, 2, 2);
  ASSERT_EQ(older.size(), 2u);
  EXPECT_EQ(older[0].content, "m1");
}

TEST_F(MariaDbRepositoryItTest, ContentIsStoredVerbatim) {
  const std::string content = "it's \"quoted\" \\ 한글";
  repository_->CreateMessage(room_id_, alice_, content);
  auto messages = repository_->ListMessages(room_id_, 1, 0);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].content, content);
}

TEST_F(MariaDbRepositoryItTest, MarkReadIsIdempotent) {
  auto message = repository_->CreateMessage(room_id_, alice_, "read me");
  EXPECT_NO_THROW(repository_->MarkRead(message.id, bob_.user_id));
  EXPECT_NO_THROW(repository_->MarkRead(message.id, bob_.user_id));
}

TEST_F(MariaDbRepositoryItTest, MarkReadOfUnknownMessageFails) {
  EXPECT_THROW(repository_->MarkRead(sent::GenerateUuid(), bob_.user_id), sent::StoreError);
}

TEST_F(MariaDbRepositoryItTest, CreateThreadReturnsFreshRoom) {
  auto first = repository_->CreateThread("plans", alice_.user_id);
  auto second = repository_->CreateThread("plans", alice_.user_id);
  EXPECT_EQ(first.size(), 36u);
  EXPECT_NE(first, second);
}

TEST_F(MariaDbRepositoryItTest, TransientFailureRetriesInsert) {
  std::size_t injected = 0;
  db_client_->SetTransientInjector([&](std::size_t attempt) {
    if (attempt == 1) {
      ++injected;
      return true;
    }
    return false;
  });
  auto message = repository_->CreateMessage(room_id_, alice_, "after retry");
  db_client_->SetTransientInjector(nullptr);

  EXPECT_EQ(injected, 1u);
  auto messages = repository_->ListMessages(room_id_, 10, 0);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].id, message.id);
}

TEST_F(MariaDbRepositoryItTest, PersistentFailureSurfacesAsStoreError) {
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(repository_->CreateMessage(room_id_, alice_, "never"), sent::StoreError);
  db_client_->SetTransientInjector(nullptr);
  EXPECT_TRUE(repository_->ListMessages(room_id_, 10, 0).empty());
}

}  // namespace
