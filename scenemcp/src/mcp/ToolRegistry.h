/**
 * @file ToolRegistry.h
 * @brief Tool descriptors, argument schemas and schema-driven argument coercion
 */

#pragma once

#include "../EventLogger.h"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace scenemcp::mcp
{
    enum class SemanticType
    {
        String,
        Number,
        Integer,
        Boolean,
        Vector3,
        Color,
        Object,
        Array
    };

    std::string toString(SemanticType type);

    struct Vector3
    {
        double x{0.};
        double y{0.};
        double z{0.};
    };

    struct Color
    {
        double r{0.};
        double g{0.};
        double b{0.};
        double a{1.};
    };

    /// Normalized value of a single tool argument
    using ArgumentValue =
      std::variant<std::string, double, int64_t, bool, Vector3, Color, nlohmann::json>;

    /// Normalized, strongly typed arguments of a tool call keyed by parameter name
    using ArgumentSet = std::map<std::string, ArgumentValue>;

    nlohmann::json toJson(ArgumentValue const & value);
    nlohmann::json toJson(ArgumentSet const & arguments);

    struct ParameterSpec
    {
        std::string name;
        SemanticType type{SemanticType::String};
        bool required{false};
        std::optional<nlohmann::json> defaultValue;
        std::string description;
    };

    /**
     * @brief Immutable description of a remote-callable tool
     *
     * The handler names the operation the worker executes; it defaults to the tool name.
     */
    struct ToolDescriptor
    {
        std::string name;
        std::string description;
        std::vector<ParameterSpec> parameters;
        std::string handler;
    };

    /**
     * @brief Mapping from tool name to descriptor
     *
     * Tools are registered during startup. After seal() the registry is read-only and
     * may be shared by concurrent requests without locking.
     */
    class ToolRegistry
    {
      public:
        explicit ToolRegistry(events::SharedLogger logger = {});

        /**
         * @brief Add a tool
         * @throws DuplicateToolError if a tool with the same name exists
         * @throws ScenemcpException if the registry has been sealed
         */
        void registerTool(ToolDescriptor descriptor);

        /// @throws ToolNotFoundError if no tool with this name is registered
        [[nodiscard]] ToolDescriptor const & resolve(std::string const & name) const;

        [[nodiscard]] bool contains(std::string const & name) const;

        /**
         * @brief Coerce loosely typed arguments against the descriptor's schema
         *
         * Missing optional parameters receive their defaults, unknown names are dropped.
         * A null value counts as absent.
         * @throws ValidationError on a missing required parameter or a type mismatch
         */
        [[nodiscard]] ArgumentSet validate(ToolDescriptor const & descriptor,
                                           nlohmann::json const & arguments) const;

        /// JSON schema of the tool's parameters, as advertised by tools/list
        [[nodiscard]] static nlohmann::json inputSchema(ToolDescriptor const & descriptor);

        /// Tools in registration order
        [[nodiscard]] std::vector<ToolDescriptor> const & tools() const
        {
            return m_tools;
        }

        [[nodiscard]] size_t size() const
        {
            return m_tools.size();
        }

        void seal()
        {
            m_sealed = true;
        }

        [[nodiscard]] bool isSealed() const
        {
            return m_sealed;
        }

      private:
        std::vector<ToolDescriptor> m_tools;
        std::unordered_map<std::string, size_t> m_index;
        bool m_sealed{false};
        events::SharedLogger m_logger;
    };

    /// @throws ValidationError if value does not match the semantic type
    ArgumentValue coerceArgument(ParameterSpec const & spec, nlohmann::json const & value);
}
