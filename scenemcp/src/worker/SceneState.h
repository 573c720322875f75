/**
 * @file SceneState.h
 * @brief In-memory scene manipulated by the reference worker
 */

#pragma once

#include "../exceptions.h"

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scenemcp::worker
{
    /// Tool failure reported back to the server with a machine readable code
    class SceneError : public ScenemcpException
    {
      public:
        SceneError(std::string code, std::string const & message)
            : ScenemcpException(message)
            , m_code(std::move(code))
        {
        }

        [[nodiscard]] std::string const & code() const
        {
            return m_code;
        }

      private:
        std::string m_code;
    };

    using Position = std::array<double, 3>;
    using Rgba = std::array<double, 4>;

    struct SceneObject
    {
        std::string name;
        std::string type;
        Position location{0., 0., 0.};
        double size{0.};
        double radius{0.};
        std::optional<std::string> material;
    };

    struct SceneMaterial
    {
        std::string name;
        Rgba color{0.8, 0.8, 0.8, 1.};
    };

    class SceneState
    {
      public:
        /**
         * @brief Execute a tool by name
         * @throws SceneError for unknown tools, missing objects or invalid arguments
         */
        nlohmann::json execute(std::string const & tool, nlohmann::json const & arguments);

        /// Objects with the same name are replaced
        std::string createCube(std::string const & name, Position const & location, double size);

        std::string
        createSphere(std::string const & name, Position const & location, double radius);

        std::string setMaterial(std::string const & objectName,
                                std::string const & materialName,
                                Rgba const & color);

        /// Resolution is clamped to 512x512; no pixels are produced
        nlohmann::json renderImage(std::string const & filepath,
                                   int64_t resolutionX,
                                   int64_t resolutionY);

        std::string reset();

        [[nodiscard]] nlohmann::json info() const;

        [[nodiscard]] std::vector<SceneObject> const & objects() const
        {
            return m_objects;
        }

        [[nodiscard]] SceneObject const * findObject(std::string const & name) const;

        static constexpr int MAX_RENDER_RESOLUTION{512};

      private:
        void addObject(SceneObject object);

        std::vector<SceneObject> m_objects;
        std::vector<SceneMaterial> m_materials;
        std::optional<std::string> m_activeObject;
    };
}
