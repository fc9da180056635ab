#include <gtest/gtest.h>

#include "adapters/secondary/document/PlainTextExtractor.hpp"
#include "adapters/secondary/persistence/InMemoryEphemeralStore.hpp"
#include "adapters/secondary/persistence/InMemorySessionRegistry.hpp"
#include "application/DocumentService.hpp"
#include "mocks/TempDirectory.hpp"
#include "mocks/VanishingSessionRegistry.hpp"

#include <filesystem>

using namespace sandbox;
using namespace sandbox::tests::mocks;

class DocumentServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessionSettings_ = std::make_shared<settings::SessionSettings>();
        sessionSettings_->setTtlHours(72);
        documentSettings_ = std::make_shared<settings::DocumentSettings>();
        documentSettings_->setUploadDir(dir_.str());
        documentSettings_->setMaxFileSizeMb(1);

        registry_ = std::make_shared<adapters::secondary::InMemorySessionRegistry>(sessionSettings_);
        store_ = std::make_shared<adapters::secondary::InMemoryEphemeralStore>();
        service_ = std::make_shared<application::DocumentService>(
            registry_, store_, std::make_shared<adapters::secondary::PlainTextExtractor>(), documentSettings_);

        alice_ = registry_->create("researcher_aaaa0000", "plain$a");
        bob_ = registry_->create("researcher_bbbb0000", "plain$b");
    }

    TempDirectory dir_{"sandbox-uploads"};
    std::shared_ptr<settings::SessionSettings> sessionSettings_;
    std::shared_ptr<settings::DocumentSettings> documentSettings_;
    std::shared_ptr<adapters::secondary::InMemorySessionRegistry> registry_;
    std::shared_ptr<adapters::secondary::InMemoryEphemeralStore> store_;
    std::shared_ptr<application::DocumentService> service_;
    std::string alice_;
    std::string bob_;
};

// ============================================================================
// UPLOAD
// ============================================================================

TEST_F(DocumentServiceTest, Upload_TextFileIsStoredAndProcessed) {
    auto result = service_->upload(alice_, "notes.txt", "three little words");

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.document.filename, "notes.txt");
    EXPECT_EQ(result.document.fileType, ".txt");
    EXPECT_EQ(result.document.sizeBytes, 18);
    EXPECT_TRUE(std::filesystem::exists(result.document.storagePath));

    ASSERT_TRUE(result.document.isProcessed());
    EXPECT_TRUE(result.document.processing->succeeded());
    EXPECT_EQ(result.document.processing->content, "three little words");
    EXPECT_EQ(result.document.processing->wordCount, 3);
    EXPECT_EQ(result.document.processing->pageCount, 1);
    EXPECT_EQ(registry_->get(alice_)->documentIds.count(result.document.id), 1u);
}

// Ошибка экстрактора сохраняется, загрузка при этом успешна
TEST_F(DocumentServiceTest, Upload_ExtractorFailureIsRecorded) {
    auto result = service_->upload(alice_, "paper.PDF", "%PDF-1.4");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.document.fileType, ".pdf");
    ASSERT_TRUE(result.document.isProcessed());
    EXPECT_FALSE(result.document.processing->succeeded());
}

TEST_F(DocumentServiceTest, Upload_RejectsDisallowedType) {
    auto result = service_->upload(alice_, "script.sh", "rm -rf /");

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("File type not allowed"), std::string::npos);
    EXPECT_EQ(store_->documentCount(), 0u);
}

TEST_F(DocumentServiceTest, Upload_RejectsOversizedFile) {
    std::string content(1024 * 1024 + 1, 'x');

    auto result = service_->upload(alice_, "big.txt", content);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "File too large. Maximum size: 1MB");
    EXPECT_EQ(store_->documentCount(), 0u);
}

TEST_F(DocumentServiceTest, Upload_StripsDirectoryComponents) {
    auto result = service_->upload(alice_, "../../etc/notes.txt", "x");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.document.filename, "notes.txt");
    auto stored = std::filesystem::path(result.document.storagePath);
    EXPECT_EQ(stored.parent_path(), dir_.path() / alice_);
}

TEST_F(DocumentServiceTest, Upload_RequiresUsableSession) {
    registry_->markInactive(alice_);

    EXPECT_EQ(service_->upload(alice_, "notes.txt", "x").message, "Invalid session");
    EXPECT_EQ(service_->upload("missing", "notes.txt", "x").message, "Invalid session");
}

// ============================================================================
// ВЛАДЕНИЕ
// ============================================================================

TEST_F(DocumentServiceTest, GetAndDelete_OnlyByOwner) {
    auto uploaded = service_->upload(alice_, "notes.txt", "text");
    ASSERT_TRUE(uploaded.success);
    const auto& id = uploaded.document.id;

    EXPECT_FALSE(service_->getDocument(bob_, id).has_value());
    EXPECT_FALSE(service_->deleteDocument(bob_, id));
    EXPECT_TRUE(service_->getDocument(alice_, id).has_value());

    EXPECT_TRUE(service_->deleteDocument(alice_, id));
    EXPECT_FALSE(service_->getDocument(alice_, id).has_value());
    EXPECT_EQ(registry_->get(alice_)->documentIds.count(id), 0u);
}

TEST_F(DocumentServiceTest, ListDocuments_ScopedToSession) {
    service_->upload(alice_, "a.txt", "a");
    service_->upload(alice_, "b.txt", "b");
    service_->upload(bob_, "c.txt", "c");

    EXPECT_EQ(service_->listDocuments(alice_).size(), 2u);
    EXPECT_EQ(service_->listDocuments(bob_).size(), 1u);
}

// Сессия снята очисткой посреди загрузки: ни записи, ни файла не остаётся
TEST_F(DocumentServiceTest, Upload_SessionRemovedDuringUploadLeavesNothing) {
    auto registry = std::make_shared<VanishingSessionRegistry>(sessionSettings_);
    application::DocumentService service(
        registry, store_, std::make_shared<adapters::secondary::PlainTextExtractor>(), documentSettings_);
    auto carol = registry->create("researcher_cccc0000", "plain$c");

    auto result = service.upload(carol, "notes.txt", "late words");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Invalid session");
    EXPECT_EQ(store_->documentCount(), 0u);
    size_t files = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir_.path())) {
        if (entry.is_regular_file()) {
            ++files;
        }
    }
    EXPECT_EQ(files, 0u);
}
