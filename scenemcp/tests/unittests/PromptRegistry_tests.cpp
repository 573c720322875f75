#include "exceptions.h"
#include "mcp/PromptRegistry.h"
#include "mcp/ResourceRegistry.h"
#include "mcp/SceneTools.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace scenemcp::tests
{
    using json = nlohmann::json;
    using namespace scenemcp::mcp;

    class PromptRegistryTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            m_registry.registerPrompt({.name = "grid",
                                       .description = "Grid of cubes",
                                       .arguments = {{"rows", "Number of rows", false, "3"},
                                                     {"size", "Cube size", true}},
                                       .text = "{{rows}} rows of cubes with size {{size}}"});
        }

        std::string text(json const & prompt)
        {
            return prompt["messages"][0]["content"]["text"].get<std::string>();
        }

        PromptRegistry m_registry;
    };

    TEST_F(PromptRegistryTest, Get_AllArguments_ReplacesEveryPlaceholder)
    {
        // Act
        auto const prompt = m_registry.get("grid", {{"rows", "4"}, {"size", "1.5"}});

        // Assert
        EXPECT_EQ(prompt["description"], "Grid of cubes");
        EXPECT_EQ(text(prompt), "4 rows of cubes with size 1.5");
    }

    TEST_F(PromptRegistryTest, Get_AbsentOptionalArgument_UsesDefault)
    {
        EXPECT_EQ(text(m_registry.get("grid", {{"size", "2"}})), "3 rows of cubes with size 2");
    }

    TEST_F(PromptRegistryTest, Get_InvalidArguments_ThrowValidationError)
    {
        EXPECT_THROW((void) m_registry.get("grid", json::object()), ValidationError);
        EXPECT_THROW((void) m_registry.get("grid", {{"size", 2}}), ValidationError);
    }

    TEST_F(PromptRegistryTest, Get_UnknownPrompt_ThrowsPromptNotFoundError)
    {
        EXPECT_THROW((void) m_registry.get("castle", json::object()), PromptNotFoundError);
    }

    TEST_F(PromptRegistryTest, RegisterPrompt_DuplicateName_Throws)
    {
        EXPECT_THROW(m_registry.registerPrompt({.name = "grid"}), ScenemcpException);
        EXPECT_EQ(m_registry.size(), 1u);
    }

    TEST_F(PromptRegistryTest, List_DescribesArguments)
    {
        // Act
        auto const prompts = m_registry.list()["prompts"];

        // Assert
        ASSERT_EQ(prompts.size(), 1u);
        EXPECT_EQ(prompts[0]["arguments"][0]["name"], "rows");
        EXPECT_EQ(prompts[0]["arguments"][0]["required"], false);
        EXPECT_EQ(prompts[0]["arguments"][1]["required"], true);
    }

    TEST(ScenePrompts, EveryPromptRendersWithoutLeftoverPlaceholders)
    {
        // Arrange
        PromptRegistry registry;
        registerScenePrompts(registry);
        json const arguments = {{"count", "8"}, {"radius", "5"}, {"filepath", "/tmp/out.png"}};

        // Act & Assert
        for (auto const & entry : registry.list()["prompts"])
        {
            auto const prompt = registry.get(entry["name"].get<std::string>(), arguments);
            auto const rendered = prompt["messages"][0]["content"]["text"].get<std::string>();
            EXPECT_EQ(rendered.find("{{"), std::string::npos) << entry["name"];
        }
    }

    TEST(ResourceRegistry, Resolve_RegisteredUri_ReturnsDescriptor)
    {
        // Arrange
        ResourceRegistry registry;
        registerSceneResources(registry);

        // Act
        auto const & descriptor = registry.resolve("scene://info");

        // Assert
        EXPECT_EQ(descriptor.tool, "get_scene_info");
        EXPECT_THROW((void) registry.resolve("scene://nothing"), ResourceNotFoundError);
        EXPECT_THROW(registry.registerResource({.uri = "scene://info"}), ScenemcpException);
    }

    TEST(ResourceRegistry, ResourceContents_StringValue_IsUsedAsText)
    {
        // Arrange
        ResourceDescriptor const descriptor{.uri = "scene://note", .tool = "note"};

        // Act
        auto const contents = resourceContents(descriptor, "hello")["contents"];

        // Assert
        ASSERT_EQ(contents.size(), 1u);
        EXPECT_EQ(contents[0]["text"], "hello");
        EXPECT_EQ(contents[0]["mimeType"], "text/plain");
    }
}
