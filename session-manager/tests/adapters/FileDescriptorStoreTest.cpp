#include <gtest/gtest.h>

#include "adapters/secondary/persistence/FileDescriptorStore.hpp"
#include "mocks/TempDirectory.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace sandbox;
using namespace sandbox::tests::mocks;

class FileDescriptorStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessionSettings_ = std::make_shared<settings::SessionSettings>();
        sessionSettings_->setSessionsDir(dir_.str());
        runtimeSettings_ = std::make_shared<settings::RuntimeSettings>();
        runtimeSettings_->setContainerPrefix("research_sandbox");
        store_ = std::make_shared<adapters::secondary::FileDescriptorStore>(sessionSettings_, runtimeSettings_);
    }

    domain::SessionDescriptor makeDescriptor(const std::string& id) {
        domain::SessionDescriptor d;
        d.sessionId = id;
        d.username = "researcher_1a2b3c4d";
        d.passwordHash = "$argon2id$v=19$m=65536,t=2,p=1$salt$hash";
        d.createdAt = *domain::Timestamp::fromString("2025-12-16T10:30:00Z");
        d.ttlHours = 72;
        d.expiresAt = d.createdAt.addHours(72);
        d.allocation.sessionId = id;
        d.allocation.backendPort = 8003;
        d.allocation.frontendPort = 3003;
        d.allocation.subnet = "172.23.41.0/24";
        d.allocation.containerName = "research_sandbox_" + id;
        return d;
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    TempDirectory dir_{"descriptor-store"};
    std::shared_ptr<settings::SessionSettings> sessionSettings_;
    std::shared_ptr<settings::RuntimeSettings> runtimeSettings_;
    std::shared_ptr<adapters::secondary::FileDescriptorStore> store_;
};

TEST_F(FileDescriptorStoreTest, SaveAndLoad) {
    auto descriptor = makeDescriptor("abc123");
    descriptor.appliedExtensions = {"req-1"};
    descriptor.lastHealth = domain::HealthSnapshot{
        "running", "exited", true, "71h 59m remaining", descriptor.createdAt};

    store_->save(descriptor);
    auto loaded = store_->load("abc123");

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->username, descriptor.username);
    EXPECT_EQ(loaded->passwordHash, descriptor.passwordHash);
    EXPECT_EQ(loaded->createdAt, descriptor.createdAt);
    EXPECT_EQ(loaded->expiresAt, descriptor.expiresAt);
    EXPECT_EQ(loaded->ttlHours, 72);
    EXPECT_EQ(loaded->allocation.backendPort, 8003);
    EXPECT_EQ(loaded->allocation.subnet, "172.23.41.0/24");
    EXPECT_EQ(loaded->allocation.containerName, "research_sandbox_abc123");
    EXPECT_TRUE(loaded->hasExtension("req-1"));
    ASSERT_TRUE(loaded->lastHealth.has_value());
    EXPECT_EQ(loaded->lastHealth->frontend, "exited");
    EXPECT_EQ(loaded->lastHealth->backendReachable, std::optional<bool>(true));
}

TEST_F(FileDescriptorStoreTest, Save_WritesExpectedJsonKeys) {
    store_->save(makeDescriptor("abc123"));

    auto json = nlohmann::json::parse(readFile(dir_.str() + "/abc123/session.json"));

    EXPECT_EQ(json["session_id"], "abc123");
    EXPECT_EQ(json["created_at"], "2025-12-16T10:30:00Z");
    EXPECT_EQ(json["expires_at"], "2025-12-19T10:30:00Z");
    EXPECT_EQ(json["container_config"]["backend_port"], 8003);
    EXPECT_FALSE(json.contains("last_health"));
}

TEST_F(FileDescriptorStoreTest, WriteEnvFile_ContainsRuntimeSettings) {
    auto descriptor = makeDescriptor("abc123");
    store_->writeEnvFile(descriptor, "deadbeef");

    auto path = store_->envFilePath("abc123");
    ASSERT_TRUE(path.has_value());
    auto env = readFile(*path);

    EXPECT_NE(env.find("SESSION_ID=abc123\n"), std::string::npos);
    EXPECT_NE(env.find("BACKEND_PORT=8003\n"), std::string::npos);
    EXPECT_NE(env.find("FRONTEND_PORT=3003\n"), std::string::npos);
    EXPECT_NE(env.find("SESSION_SUBNET=172.23.41.0/24\n"), std::string::npos);
    EXPECT_NE(env.find("SECRET_KEY=deadbeef\n"), std::string::npos);
    EXPECT_NE(env.find("COMPOSE_PROJECT_NAME=research_sandbox_abc123\n"), std::string::npos);

    auto perms = std::filesystem::status(*path).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::group_read, std::filesystem::perms::none);
}

TEST_F(FileDescriptorStoreTest, UnsafeSessionIdsAreRejected) {
    EXPECT_THROW(store_->save(makeDescriptor("../escape")), std::invalid_argument);
    EXPECT_FALSE(store_->load("../escape").has_value());
    EXPECT_FALSE(store_->exists(".."));
    EXPECT_FALSE(store_->remove("a/b"));
}

// Битый файл пропускается, остальные загружаются
TEST_F(FileDescriptorStoreTest, LoadAll_SkipsCorruptDescriptors) {
    store_->save(makeDescriptor("good"));
    std::filesystem::create_directories(dir_.path() / "bad");
    std::ofstream(dir_.path() / "bad" / "session.json") << "{ not json";
    std::filesystem::create_directories(dir_.path() / "empty");

    auto all = store_->loadAll();

    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].sessionId, "good");
}

TEST_F(FileDescriptorStoreTest, LoadAll_MissingDirectory) {
    sessionSettings_->setSessionsDir((dir_.path() / "nowhere").string());

    EXPECT_TRUE(store_->loadAll().empty());
}

TEST_F(FileDescriptorStoreTest, Remove_DeletesWholeDirectory) {
    auto descriptor = makeDescriptor("abc123");
    store_->save(descriptor);
    store_->writeEnvFile(descriptor, "key");

    EXPECT_TRUE(store_->remove("abc123"));
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "abc123"));
    EXPECT_FALSE(store_->remove("abc123"));
    EXPECT_FALSE(store_->envFilePath("abc123").has_value());
}

// ============================================================================
// UPDATE
// ============================================================================

TEST_F(FileDescriptorStoreTest, Update_AppliesMutatorToFreshCopy) {
    store_->save(makeDescriptor("abc123"));
    auto other = std::make_shared<adapters::secondary::FileDescriptorStore>(sessionSettings_, runtimeSettings_);
    other->update("abc123", [](domain::SessionDescriptor& d) {
        d.ttlHours = 96;
        return true;
    });

    auto updated = store_->update("abc123", [](domain::SessionDescriptor& d) {
        d.active = false;
        return true;
    });

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->ttlHours, 96);
    EXPECT_FALSE(updated->active);
    EXPECT_EQ(store_->load("abc123")->ttlHours, 96);
}

TEST_F(FileDescriptorStoreTest, Update_FalseLeavesFileUntouched) {
    store_->save(makeDescriptor("abc123"));
    auto before = readFile((dir_.path() / "abc123" / "session.json").string());

    auto result = store_->update("abc123", [](domain::SessionDescriptor& d) {
        d.ttlHours = 1;
        return false;
    });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(readFile((dir_.path() / "abc123" / "session.json").string()), before);
}

TEST_F(FileDescriptorStoreTest, Update_MissingDescriptor) {
    bool called = false;
    auto result = store_->update("ghost", [&called](domain::SessionDescriptor&) {
        called = true;
        return true;
    });

    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(called);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "ghost"));
}

// Два независимых хранилища над одним каталогом не теряют правки друг друга
TEST_F(FileDescriptorStoreTest, Update_ConcurrentWritersDoNotLoseChanges) {
    store_->save(makeDescriptor("abc123"));
    auto other = std::make_shared<adapters::secondary::FileDescriptorStore>(sessionSettings_, runtimeSettings_);

    const int UPDATES = 50;
    auto increment = [](const std::shared_ptr<adapters::secondary::FileDescriptorStore>& target) {
        for (int i = 0; i < UPDATES; ++i) {
            target->update("abc123", [](domain::SessionDescriptor& d) {
                d.ttlHours += 1;
                return true;
            });
        }
    };

    std::thread first(increment, store_);
    std::thread second(increment, other);
    first.join();
    second.join();

    EXPECT_EQ(store_->load("abc123")->ttlHours, 72 + 2 * UPDATES);
}
