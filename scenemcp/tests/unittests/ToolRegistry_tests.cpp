#include "exceptions.h"
#include "mcp/SceneTools.h"
#include "mcp/ToolRegistry.h"

#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>

namespace scenemcp::tests
{
    using json = nlohmann::json;
    using namespace scenemcp::mcp;

    class ToolRegistryTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            m_logger = std::make_shared<events::Logger>();
            m_logger->setFileLoggingEnabled(false);
            m_logger->setOutputMode(events::OutputMode::Silent);
            m_registry = std::make_unique<ToolRegistry>(m_logger);
            registerSceneTools(*m_registry);
        }

        events::SharedLogger m_logger;
        std::unique_ptr<ToolRegistry> m_registry;
    };

    TEST_F(ToolRegistryTest, RegisterSceneTools_RegistersAllToolsInOrder)
    {
        // Assert
        ASSERT_EQ(m_registry->size(), 6u);
        EXPECT_EQ(m_registry->tools()[0].name, "create_cube");
        EXPECT_EQ(m_registry->tools()[5].name, "get_scene_info");
        EXPECT_TRUE(m_registry->contains("set_material"));
        EXPECT_FALSE(m_registry->contains("create_cone"));
    }

    TEST_F(ToolRegistryTest, RegisterTool_DuplicateName_ThrowsDuplicateToolError)
    {
        // Act & Assert
        EXPECT_THROW(m_registry->registerTool({.name = "create_cube"}), DuplicateToolError);
    }

    TEST_F(ToolRegistryTest, RegisterTool_AfterSeal_Throws)
    {
        // Arrange
        m_registry->seal();

        // Act & Assert
        EXPECT_THROW(m_registry->registerTool({.name = "extrude"}), ScenemcpException);
        EXPECT_EQ(m_registry->size(), 6u);
    }

    TEST_F(ToolRegistryTest, RegisterTool_WithoutHandler_UsesToolName)
    {
        // Act
        m_registry->registerTool({.name = "extrude", .description = "Extrude a face"});

        // Assert
        EXPECT_EQ(m_registry->resolve("extrude").handler, "extrude");
    }

    TEST_F(ToolRegistryTest, Resolve_UnknownTool_ThrowsToolNotFoundError)
    {
        EXPECT_THROW((void) m_registry->resolve("create_cone"), ToolNotFoundError);
    }

    TEST_F(ToolRegistryTest, Validate_EmptyArguments_AppliesDefaults)
    {
        // Arrange
        auto const & descriptor = m_registry->resolve("create_cube");

        // Act
        auto const arguments = m_registry->validate(descriptor, json::object());

        // Assert
        ASSERT_EQ(arguments.size(), 3u);
        EXPECT_EQ(std::get<std::string>(arguments.at("name")), "Cube");
        EXPECT_DOUBLE_EQ(std::get<double>(arguments.at("size")), 2.0);
        auto const location = std::get<Vector3>(arguments.at("location"));
        EXPECT_DOUBLE_EQ(location.x, 0.);
        EXPECT_DOUBLE_EQ(location.y, 0.);
        EXPECT_DOUBLE_EQ(location.z, 0.);
    }

    TEST_F(ToolRegistryTest, Validate_NullArguments_TreatedAsEmpty)
    {
        auto const arguments =
          m_registry->validate(m_registry->resolve("create_sphere"), json(nullptr));

        EXPECT_DOUBLE_EQ(std::get<double>(arguments.at("radius")), 1.0);
    }

    TEST_F(ToolRegistryTest, Validate_IntegerForNumber_CoercesToDouble)
    {
        // Act
        auto const arguments = m_registry->validate(m_registry->resolve("create_cube"),
                                                    {{"size", 3}, {"location", {1, 2, 3}}});

        // Assert
        EXPECT_DOUBLE_EQ(std::get<double>(arguments.at("size")), 3.0);
        EXPECT_DOUBLE_EQ(std::get<Vector3>(arguments.at("location")).z, 3.0);
    }

    TEST_F(ToolRegistryTest, Validate_IntegralFloatForInteger_CoercesToInteger)
    {
        // Act
        auto const arguments =
          m_registry->validate(m_registry->resolve("render_image"),
                               {{"filepath", "/tmp/out.png"}, {"resolution_x", 640.0}});

        // Assert
        EXPECT_EQ(std::get<int64_t>(arguments.at("resolution_x")), 640);
        EXPECT_EQ(std::get<int64_t>(arguments.at("resolution_y")), 1080);
    }

    TEST_F(ToolRegistryTest, Validate_FractionalFloatForInteger_ThrowsValidationError)
    {
        EXPECT_THROW((void) m_registry->validate(
                       m_registry->resolve("render_image"),
                       {{"filepath", "/tmp/out.png"}, {"resolution_x", 640.5}}),
                     ValidationError);
    }

    TEST_F(ToolRegistryTest, CoerceArgument_FloatBeyondInt64Range_ThrowsValidationError)
    {
        // Arrange
        ParameterSpec const spec{"resolution_x", SemanticType::Integer};

        // Act & Assert
        EXPECT_THROW((void) coerceArgument(spec, json(1e30)), ValidationError);
        EXPECT_THROW((void) coerceArgument(spec, json(-1e30)), ValidationError);
        EXPECT_THROW((void) coerceArgument(spec, json(9223372036854775808.0)), ValidationError);
    }

    TEST_F(ToolRegistryTest, CoerceArgument_UnsignedAboveInt64Max_ThrowsValidationError)
    {
        // Arrange
        ParameterSpec const spec{"resolution_x", SemanticType::Integer};
        auto const tooLarge = json::parse("18446744073709551615");
        auto const largest = json::parse("9223372036854775807");

        // Act & Assert
        EXPECT_THROW((void) coerceArgument(spec, tooLarge), ValidationError);
        EXPECT_EQ(std::get<int64_t>(coerceArgument(spec, largest)),
                  std::numeric_limits<int64_t>::max());
    }

    TEST_F(ToolRegistryTest, Validate_MissingRequiredParameter_ThrowsValidationError)
    {
        // Arrange
        auto const & descriptor = m_registry->resolve("set_material");

        // Act & Assert
        try
        {
            (void) m_registry->validate(descriptor, {{"material_name", "Red"}});
            FAIL() << "Expected ValidationError";
        }
        catch (ValidationError const & e)
        {
            EXPECT_NE(std::string(e.what()).find("object_name"), std::string::npos);
        }
    }

    TEST_F(ToolRegistryTest, Validate_WrongType_ThrowsValidationError)
    {
        EXPECT_THROW((void) m_registry->validate(m_registry->resolve("create_cube"),
                                                 {{"size", "large"}}),
                     ValidationError);
        EXPECT_THROW((void) m_registry->validate(m_registry->resolve("create_cube"),
                                                 {{"location", {1, 2}}}),
                     ValidationError);
        EXPECT_THROW((void) m_registry->validate(m_registry->resolve("create_cube"),
                                                 {{"location", {1, "two", 3}}}),
                     ValidationError);
    }

    TEST_F(ToolRegistryTest, Validate_NonObjectArguments_ThrowsValidationError)
    {
        EXPECT_THROW(
          (void) m_registry->validate(m_registry->resolve("create_cube"), json::array({1, 2})),
          ValidationError);
    }

    TEST_F(ToolRegistryTest, Validate_RgbColor_DefaultsAlphaToOne)
    {
        // Act
        auto const arguments =
          m_registry->validate(m_registry->resolve("set_material"),
                               {{"object_name", "Cube"}, {"color", {1.0, 0.0, 0.0}}});

        // Assert
        auto const color = std::get<Color>(arguments.at("color"));
        EXPECT_DOUBLE_EQ(color.r, 1.0);
        EXPECT_DOUBLE_EQ(color.a, 1.0);
        EXPECT_EQ(toJson(arguments.at("color")), json::array({1.0, 0.0, 0.0, 1.0}));
    }

    TEST_F(ToolRegistryTest, Validate_ColorOutOfRange_ThrowsValidationError)
    {
        EXPECT_THROW((void) m_registry->validate(m_registry->resolve("set_material"),
                                                 {{"object_name", "Cube"}, {"color", {2, 0, 0}}}),
                     ValidationError);
    }

    TEST_F(ToolRegistryTest, Validate_UnknownArgument_IsDroppedWithWarning)
    {
        // Arrange
        auto const warningsBefore = m_logger->getWarningCount();

        // Act
        auto const arguments = m_registry->validate(m_registry->resolve("reset_scene"),
                                                    {{"scene_id", "default"}});

        // Assert
        EXPECT_TRUE(arguments.empty());
        EXPECT_EQ(m_logger->getWarningCount(), warningsBefore + 1);
    }

    TEST_F(ToolRegistryTest, InputSchema_SetMaterial_ListsRequiredAndTypedProperties)
    {
        // Act
        auto const schema = ToolRegistry::inputSchema(m_registry->resolve("set_material"));

        // Assert
        EXPECT_EQ(schema["type"], "object");
        EXPECT_EQ(schema["required"], json::array({"object_name"}));
        EXPECT_EQ(schema["properties"]["object_name"]["type"], "string");
        EXPECT_EQ(schema["properties"]["color"]["type"], "array");
        EXPECT_EQ(schema["properties"]["color"]["maxItems"], 4);
        EXPECT_EQ(schema["properties"]["material_name"]["default"], "Material");
    }

    TEST_F(ToolRegistryTest, InputSchema_ToolWithoutParameters_HasNoRequiredList)
    {
        auto const schema = ToolRegistry::inputSchema(m_registry->resolve("get_scene_info"));

        EXPECT_TRUE(schema["properties"].empty());
        EXPECT_FALSE(schema.contains("required"));
    }

    TEST_F(ToolRegistryTest, ToJson_ArgumentSet_ProducesPlainJson)
    {
        // Arrange
        auto const arguments =
          m_registry->validate(m_registry->resolve("create_sphere"), {{"name", "Ball"}});

        // Act
        auto const encoded = toJson(arguments);

        // Assert
        EXPECT_EQ(encoded["name"], "Ball");
        EXPECT_EQ(encoded["location"], json::array({0.0, 0.0, 0.0}));
        EXPECT_DOUBLE_EQ(encoded["radius"].get<double>(), 1.0);
    }
}
