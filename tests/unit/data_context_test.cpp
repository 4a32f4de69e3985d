// tests/unit/data_context_test.cpp
#include <gtest/gtest.h>
#include "context/include/DataContext.hpp"
#include "context/include/ContextOperationException.hpp"
#include "common/storage/include/InMemoryStorageProvider.hpp"
#include "common/config/ConfigFile.hpp"
#include "common/errors/DataException.hpp"
#include "fixtures/SampleContexts.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

using namespace data_engine;
using namespace data_engine::context;
using namespace data_engine::storage;
using namespace data_engine::test;

// ========== 테스트용 Repository ==========

// 다른 Repository 가 실패해 cancelled 가 켜질 때까지 기다렸다가 실제 로드를 진행
class WaitForCancelRepository : public repository::IRepository {
public:
    explicit WaitForCancelRepository(const std::string& path)
        : inner_("DelayedCharacter", path, Character::Schema()) {}

    const std::string& Name() const override { return inner_.Name(); }
    const std::string& Path() const override { return inner_.Path(); }
    DataFormat Format() const override { return inner_.Format(); }
    size_t Count() const override { return inner_.Count(); }
    bool IsLoaded() const override { return inner_.IsLoaded(); }

    bool Load(IStorageProvider& provider,
              const serialization::SerializerFactory& factory,
              const std::atomic<bool>* cancelled) override {
        started = true;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (cancelled != nullptr && !cancelled->load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        saw_cancel = cancelled != nullptr && cancelled->load();
        committed = inner_.Load(provider, factory, cancelled);
        return committed;
    }

    void Save(IStorageProvider& provider, const serialization::SerializerFactory& factory) const override {
        inner_.Save(provider, factory);
    }

    std::atomic<bool> started{false};
    std::atomic<bool> saw_cancel{false};
    std::atomic<bool> committed{false};

private:
    repository::Repository<std::string, Character> inner_;
};

// gate 가 켜진 뒤에 파싱 오류로 실패
class GatedFailureRepository : public repository::IRepository {
public:
    explicit GatedFailureRepository(const std::atomic<bool>& gate) : gate_(gate) {}

    const std::string& Name() const override { return name_; }
    const std::string& Path() const override { return path_; }
    DataFormat Format() const override { return DataFormat::CSV; }
    size_t Count() const override { return 0; }
    bool IsLoaded() const override { return false; }

    bool Load(IStorageProvider&, const serialization::SerializerFactory&, const std::atomic<bool>*) override {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!gate_.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw MalformedDataException(path_, 3, "bad row");
    }

    void Save(IStorageProvider&, const serialization::SerializerFactory&) const override {}

private:
    const std::atomic<bool>& gate_;
    std::string name_ = "Gate";
    std::string path_ = "Gate.csv";
};

// 로드 실패를 보고하는 도중에 Path() 가 std::system_error 를 던진다
class BrokenReportingRepository : public repository::IRepository {
public:
    const std::string& Name() const override { return name_; }
    const std::string& Path() const override {
        if (broken_) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "path unavailable");
        }
        return path_;
    }
    DataFormat Format() const override { return DataFormat::CSV; }
    size_t Count() const override { return 0; }
    bool IsLoaded() const override { return false; }

    bool Load(IStorageProvider&, const serialization::SerializerFactory&, const std::atomic<bool>*) override {
        broken_ = true;
        throw std::runtime_error("load failed");
    }

    void Save(IStorageProvider&, const serialization::SerializerFactory&) const override {}

private:
    std::string name_ = "Broken";
    std::string path_ = "Broken.csv";
    std::atomic<bool> broken_{false};
};

// ========== 테스트 Fixture ==========

class DataContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        files = {
            {"Characters.csv", kCharactersCsv},
            {"Items.json", kItemsJson},
            {"GameConfig.json", kGameConfigJson},
            {"Localizations/LocalizationKeys.csv", kLocalizationKeysCsv},
            {"Localizations/en.csv", kEnglishCsv},
            {"Localizations/ko.csv", kKoreanCsv}
        };
        config.localization_enabled = true;
    }

    // provider 는 Context 가 소유하고, 검증용 포인터만 보관
    std::unique_ptr<GameDataContext> CreateContext() {
        auto provider = std::make_unique<InMemoryStorageProvider>(files);
        storage = provider.get();
        return std::make_unique<GameDataContext>(std::move(provider),
                                                 DataContext::CreateSerializerFactory(config),
                                                 config);
    }

    // ContextOperationException 을 기대하고 반환
    template<typename TFunc>
    ContextOperationException ExpectOperationFailure(TFunc func) {
        try {
            func();
        } catch (const ContextOperationException& e) {
            return e;
        }
        ADD_FAILURE() << "ContextOperationException expected";
        return ContextOperationException("", "", "", "", std::nullopt, "");
    }

    std::map<std::string, std::string> files;
    config::ContextConfig config;
    InMemoryStorageProvider* storage = nullptr;
};

// ========== 생성 ==========

TEST_F(DataContextTest, ConstructorValidatesArguments) {
    auto factory = DataContext::CreateSerializerFactory(config);

    EXPECT_THROW(GameDataContext(nullptr, factory, config), std::invalid_argument);
    EXPECT_THROW(GameDataContext(std::make_unique<InMemoryStorageProvider>(), nullptr, config),
                 std::invalid_argument);

    config.context_name = "";
    EXPECT_THROW(GameDataContext(std::make_unique<InMemoryStorageProvider>(), factory, config),
                 config::ConfigException);
}

TEST_F(DataContextTest, RegistersRepositoriesInOrder) {
    auto context = CreateContext();

    EXPECT_EQ(context->Name(), "GameDataContext");
    EXPECT_EQ(context->GetState(), ContextState::NOT_LOADED);
    EXPECT_EQ(context->GetRepositoryNames(), (std::vector<std::string>{"Character", "Item", "GameConfig"}));
    EXPECT_EQ(&context->GetRepository("Item"), &context->items);
    EXPECT_THROW(context->GetRepository("Weapon"), NotFoundException);
    EXPECT_NE(context->Localization(), nullptr);
}

TEST_F(DataContextTest, DuplicateRepositoryNameIsRejected) {
    auto context = CreateContext();
    repository::Repository<std::string, Character> duplicate("Character", "Other.csv", Character::Schema());

    EXPECT_THROW(context->RegisterExtra(duplicate), std::invalid_argument);
}

TEST_F(DataContextTest, LocalizationDisabledHasNoLocalization) {
    config.localization_enabled = false;
    auto context = CreateContext();

    EXPECT_EQ(context->Localization(), nullptr);
    context->LoadAll();
    EXPECT_TRUE(context->IsLoaded());
}

// ========== LoadAll ==========

TEST_F(DataContextTest, LoadAllConcurrentlyPopulatesEverything) {
    auto context = CreateContext();
    context->LoadAll();

    EXPECT_EQ(context->GetState(), ContextState::LOADED);
    EXPECT_EQ(context->characters.Count(), 3u);
    EXPECT_EQ(context->items.Get(1001).Name, "Iron Sword");
    EXPECT_EQ(context->game_config.Count(), 1u);
    EXPECT_EQ(context->game_config.Get().MaxLevel, 99);

    auto* localization = context->Localization();
    ASSERT_NE(localization, nullptr);
    ASSERT_TRUE(localization->IsLoaded());
    localization->SetActiveLanguage("ko");
    EXPECT_EQ(localization->Resolve("UI_Start"), "게임 시작");
    EXPECT_EQ(localization->Resolve("Character_Hero_Name"), "Hero");
}

TEST_F(DataContextTest, LoadAllSequentiallyPopulatesEverything) {
    config.load_concurrently = false;
    auto context = CreateContext();
    context->LoadAll();

    EXPECT_TRUE(context->IsLoaded());
    EXPECT_EQ(context->characters.Get("hero").Level, 10);
    EXPECT_EQ(context->items.Count(), 2u);
}

TEST_F(DataContextTest, LoadAllAsyncCompletes) {
    auto context = CreateContext();
    auto future = context->LoadAllAsync();
    future.get();

    EXPECT_TRUE(context->IsLoaded());
}

TEST_F(DataContextTest, MalformedRepositoryAbortsLoad) {
    files["Items.json"] = "[\n  {\"Id\": 1001, \"Price\": \"free\"}\n]\n";
    auto context = CreateContext();

    auto failure = ExpectOperationFailure([&] { context->LoadAll(); });

    EXPECT_EQ(context->GetState(), ContextState::FAILED);
    EXPECT_FALSE(context->IsLoaded());
    EXPECT_EQ(failure.Operation(), "load");
    EXPECT_EQ(failure.ContextName(), "GameDataContext");
    EXPECT_EQ(failure.RepositoryName(), "Item");
    EXPECT_EQ(failure.Path(), "Items.json");
    ASSERT_TRUE(failure.CauseKind().has_value());
    EXPECT_EQ(*failure.CauseKind(), ErrorKind::MALFORMED_DATA);
    EXPECT_NE(std::string(failure.what()).find("[MALFORMED_DATA]"), std::string::npos);

    EXPECT_FALSE(context->items.IsLoaded());
    ASSERT_NE(context->Localization(), nullptr);
    EXPECT_FALSE(context->Localization()->IsLoaded());
}

TEST_F(DataContextTest, SequentialLoadSkipsRemainingAfterFailure) {
    config.load_concurrently = false;
    files.erase("Characters.csv");
    auto context = CreateContext();

    auto failure = ExpectOperationFailure([&] { context->LoadAll(); });

    EXPECT_EQ(failure.RepositoryName(), "Character");
    ASSERT_TRUE(failure.CauseKind().has_value());
    EXPECT_EQ(*failure.CauseKind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(context->GetState(), ContextState::FAILED);
    EXPECT_FALSE(context->items.IsLoaded());
}

TEST_F(DataContextTest, ConcurrentSiblingDoesNotCommitAfterFailure) {
    auto context = CreateContext();
    WaitForCancelRepository delayed("Characters.csv");
    GatedFailureRepository failing(delayed.started);
    context->RegisterExtra(delayed);
    context->RegisterExtra(failing);

    auto failure = ExpectOperationFailure([&] { context->LoadAll(); });

    EXPECT_EQ(failure.RepositoryName(), "Gate");
    ASSERT_TRUE(failure.CauseKind().has_value());
    EXPECT_EQ(*failure.CauseKind(), ErrorKind::MALFORMED_DATA);
    EXPECT_EQ(context->GetState(), ContextState::FAILED);

    // 파싱은 끝났지만 교체 직전에 취소를 보고 커밋하지 않는다
    EXPECT_TRUE(delayed.started.load());
    EXPECT_TRUE(delayed.saw_cancel.load());
    EXPECT_FALSE(delayed.committed.load());
    EXPECT_FALSE(delayed.IsLoaded());
    EXPECT_EQ(delayed.Count(), 0u);
}

TEST_F(DataContextTest, UnexpectedExceptionStillMarksContextFailed) {
    auto context = CreateContext();
    BrokenReportingRepository broken;
    context->RegisterExtra(broken);

    EXPECT_THROW(context->LoadAll(), std::system_error);
    EXPECT_EQ(context->GetState(), ContextState::FAILED);
    EXPECT_FALSE(context->IsLoaded());
}

TEST_F(DataContextTest, MalformedSingleRecordAbortsLoad) {
    files["GameConfig.json"] = "[{\"GameName\": \"x\", \"MaxLevel\": 1}]";
    auto context = CreateContext();

    auto failure = ExpectOperationFailure([&] { context->LoadAll(); });

    EXPECT_EQ(failure.RepositoryName(), "GameConfig");
    EXPECT_EQ(failure.Path(), "GameConfig.json");
    ASSERT_TRUE(failure.CauseKind().has_value());
    EXPECT_EQ(*failure.CauseKind(), ErrorKind::MALFORMED_DATA);
    EXPECT_EQ(context->GetState(), ContextState::FAILED);
    EXPECT_FALSE(context->game_config.IsLoaded());
}

TEST_F(DataContextTest, LocalizationFailureIsReported) {
    files.erase("Localizations/LocalizationKeys.csv");
    auto context = CreateContext();

    auto failure = ExpectOperationFailure([&] { context->LoadAll(); });

    EXPECT_EQ(failure.RepositoryName(), "Localization");
    EXPECT_EQ(failure.Path(), "Localizations/LocalizationKeys.csv");
    EXPECT_EQ(context->GetState(), ContextState::FAILED);
}

TEST_F(DataContextTest, FailedContextCanLoadAgain) {
    files["Items.json"] = "not json";
    auto context = CreateContext();
    ExpectOperationFailure([&] { context->LoadAll(); });
    ASSERT_EQ(context->GetState(), ContextState::FAILED);

    storage->PutFile("Items.json", kItemsJson);
    context->LoadAll();
    EXPECT_EQ(context->GetState(), ContextState::LOADED);
    EXPECT_EQ(context->items.Count(), 2u);
}

TEST_F(DataContextTest, RegistrationClosesAfterFirstLoad) {
    auto context = CreateContext();
    context->LoadAll();

    repository::Repository<std::string, ShopItem> late("ShopItem", "ShopItems.csv", ShopItem::Schema());
    EXPECT_THROW(context->RegisterExtra(late), std::logic_error);
}

// ========== Reload ==========

TEST_F(DataContextTest, ReloadReplacesSingleRepository) {
    auto context = CreateContext();
    context->LoadAll();

    storage->PutFile("Items.json", "[{\"Id\": 2001, \"Name\": \"Bow\", \"Price\": 90, \"Weight\": 1.2}]");
    context->Reload("Item");

    EXPECT_EQ(context->items.Count(), 1u);
    EXPECT_EQ(context->items.Get(2001).Name, "Bow");
    EXPECT_EQ(context->characters.Count(), 3u);
    EXPECT_THROW(context->Reload("Weapon"), NotFoundException);
}

TEST_F(DataContextTest, FailedReloadKeepsPreviousData) {
    auto context = CreateContext();
    context->LoadAll();

    storage->PutFile("Items.json", "[{\"Id\": 1}, {\"Id\": 1}]");
    auto failure = ExpectOperationFailure([&] { context->Reload("Item"); });

    ASSERT_TRUE(failure.CauseKind().has_value());
    EXPECT_EQ(*failure.CauseKind(), ErrorKind::DUPLICATE_KEY);
    EXPECT_EQ(context->items.Count(), 2u);
    EXPECT_TRUE(context->IsLoaded());
}

// ========== SaveAll ==========

TEST_F(DataContextTest, SaveAllWritesRepositoriesAndLocalization) {
    auto context = CreateContext();
    context->LoadAll();

    context->items.Add(Item{1003, "Health Potion", 25, 0.2});
    context->Localization()->SetText("UI_Start", "Begin");
    GameConfig game_config = context->game_config.Get();
    game_config.MaxLevel = 120;
    context->game_config.Set(game_config);
    context->SaveAllAsync().get();

    std::string items_json = storage->GetFile("Items.json");
    EXPECT_NE(items_json.find("\"Health Potion\""), std::string::npos);
    EXPECT_NE(storage->GetFile("Localizations/en.csv").find("UI_Start,Begin,"), std::string::npos);

    context->Reload("Item");
    EXPECT_EQ(context->items.Count(), 3u);

    context->Reload("GameConfig");
    EXPECT_EQ(context->game_config.Get().MaxLevel, 120);
    EXPECT_EQ(context->game_config.Get().AvailableModes.size(), 3u);
}

TEST_F(DataContextTest, SaveAllFailureLeavesStateUnchanged) {
    auto context = CreateContext();
    context->LoadAll();
    storage->SetReadOnly(true);

    auto failure = ExpectOperationFailure([&] { context->SaveAll(); });

    EXPECT_EQ(failure.Operation(), "save");
    EXPECT_EQ(failure.RepositoryName(), "Character");
    ASSERT_TRUE(failure.CauseKind().has_value());
    EXPECT_EQ(*failure.CauseKind(), ErrorKind::IO_FAILURE);
    EXPECT_EQ(context->GetState(), ContextState::LOADED);
}

TEST_F(DataContextTest, SaveAllClosesRegistration) {
    config.localization_enabled = false;
    auto context = CreateContext();
    context->SaveAll();

    repository::Repository<std::string, ShopItem> late("ShopItem", "ShopItems.csv", ShopItem::Schema());
    EXPECT_THROW(context->RegisterExtra(late), std::logic_error);
    EXPECT_EQ(storage->GetFile("Items.json"), "[]\n");
    // 값이 없는 단일 데이터는 덮어쓰지 않는다
    EXPECT_EQ(storage->GetFile("GameConfig.json"), kGameConfigJson);
}

// ========== 설정 ==========

TEST_F(DataContextTest, SerializerFactoryFollowsCsvDelimiters) {
    config.csv_field_delimiter = ';';
    config.csv_array_delimiter = ',';
    auto factory = DataContext::CreateSerializerFactory(config);

    EXPECT_EQ(factory->GetCsvOptions().field_delimiter, ';');
    auto rows = factory->GetSerializer("Characters.csv")->Parse(
        "Id;Tags\nhero;melee,leader\n", Character::Schema(), "Characters.csv");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["Tags"].size(), 2u);
}

TEST_F(DataContextTest, ContextStateNames) {
    EXPECT_STREQ(ContextStateToString(ContextState::NOT_LOADED), "NOT_LOADED");
    EXPECT_STREQ(ContextStateToString(ContextState::LOADED), "LOADED");
    EXPECT_STREQ(ContextStateToString(ContextState::FAILED), "FAILED");
}
