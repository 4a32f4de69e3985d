// tests/fixtures/SampleContexts.hpp
#pragma once
#include "context/include/DataContext.hpp"
#include "repository/include/Repository.hpp"
#include "repository/include/SingleRepository.hpp"
#include "serialization/include/RecordSchema.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#ifndef TEST_DATA_DIR
#define TEST_DATA_DIR "tests/data"
#endif

namespace data_engine::test
{
    using serialization::FieldType;
    using serialization::RecordSchema;

    // ========== 샘플 레코드 ==========

    struct Character
    {
        std::string Id;
        std::string Name;
        int Level = 0;
        double Attack = 0.0;
        bool IsPlayable = false;
        std::vector<std::string> Tags;
        std::vector<int> SkillIds;

        static const RecordSchema& Schema()
        {
            static const RecordSchema schema("Id", {
                { "Id", FieldType::STRING },
                { "Name", FieldType::STRING },
                { "Level", FieldType::INT },
                { "Attack", FieldType::FLOAT },
                { "IsPlayable", FieldType::BOOL },
                { "Tags", FieldType::STRING_ARRAY },
                { "SkillIds", FieldType::INT_ARRAY }
            });
            return schema;
        }
    };

    inline void to_json(nlohmann::json& j, const Character& c)
    {
        j = nlohmann::json{
            {"Id", c.Id}, {"Name", c.Name}, {"Level", c.Level}, {"Attack", c.Attack},
            {"IsPlayable", c.IsPlayable}, {"Tags", c.Tags}, {"SkillIds", c.SkillIds}
        };
    }

    inline void from_json(const nlohmann::json& j, Character& c)
    {
        j.at("Id").get_to(c.Id);
        j.at("Name").get_to(c.Name);
        j.at("Level").get_to(c.Level);
        j.at("Attack").get_to(c.Attack);
        j.at("IsPlayable").get_to(c.IsPlayable);
        j.at("Tags").get_to(c.Tags);
        j.at("SkillIds").get_to(c.SkillIds);
    }

    struct Item
    {
        int Id = 0;
        std::string Name;
        int Price = 0;
        double Weight = 0.0;

        static const RecordSchema& Schema()
        {
            static const RecordSchema schema("Id", {
                { "Id", FieldType::INT },
                { "Name", FieldType::STRING },
                { "Price", FieldType::INT },
                { "Weight", FieldType::FLOAT }
            });
            return schema;
        }
    };

    inline void to_json(nlohmann::json& j, const Item& item)
    {
        j = nlohmann::json{
            {"Id", item.Id}, {"Name", item.Name}, {"Price", item.Price}, {"Weight", item.Weight}
        };
    }

    inline void from_json(const nlohmann::json& j, Item& item)
    {
        j.at("Id").get_to(item.Id);
        j.at("Name").get_to(item.Name);
        j.at("Price").get_to(item.Price);
        j.at("Weight").get_to(item.Weight);
    }

    struct ShopItem
    {
        std::string Id;
        std::string Name;
        int Price = 0;
        int Stock = 0;
        std::vector<std::string> Categories;

        static const RecordSchema& Schema()
        {
            static const RecordSchema schema("Id", {
                { "Id", FieldType::STRING },
                { "Name", FieldType::STRING },
                { "Price", FieldType::INT },
                { "Stock", FieldType::INT },
                { "Categories", FieldType::STRING_ARRAY }
            });
            return schema;
        }
    };

    inline void to_json(nlohmann::json& j, const ShopItem& item)
    {
        j = nlohmann::json{
            {"Id", item.Id}, {"Name", item.Name}, {"Price", item.Price},
            {"Stock", item.Stock}, {"Categories", item.Categories}
        };
    }

    inline void from_json(const nlohmann::json& j, ShopItem& item)
    {
        j.at("Id").get_to(item.Id);
        j.at("Name").get_to(item.Name);
        j.at("Price").get_to(item.Price);
        j.at("Stock").get_to(item.Stock);
        j.at("Categories").get_to(item.Categories);
    }

    // 단일 object 데이터
    struct GameConfig
    {
        std::string GameName;
        int MaxLevel = 0;
        double ExpMultiplier = 1.0;
        std::string DefaultMode;
        std::vector<std::string> AvailableModes;
        std::vector<int> StartingItems;
    };

    inline void to_json(nlohmann::json& j, const GameConfig& config)
    {
        j = nlohmann::json{
            {"GameName", config.GameName}, {"MaxLevel", config.MaxLevel},
            {"ExpMultiplier", config.ExpMultiplier}, {"DefaultMode", config.DefaultMode},
            {"AvailableModes", config.AvailableModes}, {"StartingItems", config.StartingItems}
        };
    }

    inline void from_json(const nlohmann::json& j, GameConfig& config)
    {
        j.at("GameName").get_to(config.GameName);
        j.at("MaxLevel").get_to(config.MaxLevel);
        config.ExpMultiplier = j.value("ExpMultiplier", 1.0);
        config.DefaultMode = j.value("DefaultMode", std::string("Normal"));
        config.AvailableModes = j.value("AvailableModes", std::vector<std::string>{});
        config.StartingItems = j.value("StartingItems", std::vector<int>{});
    }

    // ========== 샘플 Context ==========

    class GameDataContext : public context::DataContext
    {
    public:
        GameDataContext(std::unique_ptr<storage::IStorageProvider> provider,
                        std::shared_ptr<const serialization::SerializerFactory> factory,
                        config::ContextConfig config)
            : DataContext(std::move(provider), std::move(factory), std::move(config)),
              characters("Character", "Characters.csv", Character::Schema()),
              items("Item", "Items.json", Item::Schema()),
              game_config("GameConfig", "GameConfig.json")
        {
            RegisterRepository(characters);
            RegisterRepository(items);
            RegisterRepository(game_config);
        }

        // 등록 시점 규칙 검증용
        void RegisterExtra(repository::IRepository& repository) { RegisterRepository(repository); }

        repository::Repository<std::string, Character> characters;
        repository::Repository<int, Item> items;
        repository::SingleRepository<GameConfig> game_config;
    };

    class ShopContext : public context::DataContext
    {
    public:
        ShopContext(std::unique_ptr<storage::IStorageProvider> provider,
                    std::shared_ptr<const serialization::SerializerFactory> factory,
                    config::ContextConfig config)
            : DataContext(std::move(provider), std::move(factory), std::move(config)),
              shop_items("ShopItem", "ShopItems.csv", ShopItem::Schema())
        {
            RegisterRepository(shop_items);
        }

        repository::Repository<std::string, ShopItem> shop_items;
    };

    // ========== 샘플 데이터 (메모리 저장소용) ==========

    inline const char* kCharactersCsv =
        "Id,Name,Level,Attack,IsPlayable,Tags,SkillIds,~Note\n"
        "hero,Hero,10,25.5,true,melee|leader,1|2|3,main character\n"
        "mage,\"Mage, the Wise\",8,40,true,ranged|magic,4|5,\n"
        "goblin,Goblin,3,7.25,false,,,\"enemy \"\"grunt\"\"\"\n";

    inline const char* kItemsJson =
        "[\n"
        "  {\"Id\": 1001, \"Name\": \"Iron Sword\", \"Price\": 150, \"Weight\": 3.5},\n"
        "  {\"Id\": 1002, \"Name\": \"Leather Armor\", \"Price\": 120, \"Weight\": 8.0}\n"
        "]\n";

    inline const char* kGameConfigJson =
        "{\n"
        "  \"GameName\": \"Dragon Quest Lite\",\n"
        "  \"MaxLevel\": 99,\n"
        "  \"ExpMultiplier\": 1.5,\n"
        "  \"DefaultMode\": \"Normal\",\n"
        "  \"AvailableModes\": [\"Easy\", \"Normal\", \"Hard\"],\n"
        "  \"StartingItems\": [1001, 1002]\n"
        "}\n";

    inline const char* kLocalizationKeysCsv =
        "Id,Description,Category,IsFixedKey\n"
        "UI_Title,Main title,UI,true\n"
        "UI_Start,Start button,UI,false\n"
        "Character_Hero_Name,Hero display name,Character,false\n"
        "Item_Sword_Desc,Sword tooltip,Item,false\n";

    inline const char* kEnglishCsv =
        "Id,Text,Context\n"
        "UI_Title,Dragon Quest Lite,Title screen\n"
        "UI_Start,Start Game,\n"
        "Character_Hero_Name,Hero,\n"
        "Item_Sword_Desc,\"A sturdy blade, forged in iron\",\n";

    inline const char* kKoreanCsv =
        "Id,Text,Context\n"
        "UI_Title,드래곤 퀘스트 라이트,타이틀 화면\n"
        "UI_Start,게임 시작,\n"
        "Character_Hero_Name,,\n";

    inline std::string DataPath(const std::string& relative)
    {
        return std::string(TEST_DATA_DIR) + "/" + relative;
    }

} // namespace data_engine::test
