#include "SceneState.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <fmt/format.h>

using json = nlohmann::json;

namespace scenemcp::worker
{
    namespace
    {
        template <typename T>
        T argument(json const & arguments, std::string const & name, T const & fallback)
        {
            if (!arguments.contains(name) || arguments[name].is_null())
            {
                return fallback;
            }
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>)
            {
                auto const & value = arguments[name];
                bool const representable =
                  value.is_number_integer() &&
                  !(value.is_number_unsigned() &&
                    value.get<uint64_t>() >
                      static_cast<uint64_t>(std::numeric_limits<T>::max()));
                if (!representable)
                {
                    throw SceneError("InvalidArguments",
                                     fmt::format("Invalid value for argument '{}'", name));
                }
            }
            try
            {
                return arguments[name].get<T>();
            }
            catch (json::exception const &)
            {
                throw SceneError("InvalidArguments",
                                 fmt::format("Invalid value for argument '{}'", name));
            }
        }

        std::string requiredString(json const & arguments, std::string const & name)
        {
            if (!arguments.contains(name) || !arguments[name].is_string())
            {
                throw SceneError("InvalidArguments",
                                 fmt::format("Missing required argument '{}'", name));
            }
            return arguments[name].get<std::string>();
        }

        Rgba colorArgument(json const & arguments)
        {
            auto const components =
              argument<std::vector<double>>(arguments, "color", {0.8, 0.8, 0.8, 1.0});
            if (components.size() < 3 || components.size() > 4)
            {
                throw SceneError("InvalidArguments", "color must have 3 or 4 components");
            }
            return {components[0],
                    components[1],
                    components[2],
                    components.size() == 4 ? components[3] : 1.0};
        }
    }

    json SceneState::execute(std::string const & tool, json const & arguments)
    {
        if (tool == "create_cube")
        {
            return createCube(argument<std::string>(arguments, "name", "Cube"),
                              argument<Position>(arguments, "location", {0., 0., 0.}),
                              argument<double>(arguments, "size", 2.0));
        }
        if (tool == "create_sphere")
        {
            return createSphere(argument<std::string>(arguments, "name", "Sphere"),
                                argument<Position>(arguments, "location", {0., 0., 0.}),
                                argument<double>(arguments, "radius", 1.0));
        }
        if (tool == "set_material")
        {
            return setMaterial(requiredString(arguments, "object_name"),
                               argument<std::string>(arguments, "material_name", "Material"),
                               colorArgument(arguments));
        }
        if (tool == "render_image")
        {
            return renderImage(requiredString(arguments, "filepath"),
                               argument<int64_t>(arguments, "resolution_x", 1920),
                               argument<int64_t>(arguments, "resolution_y", 1080));
        }
        if (tool == "reset_scene")
        {
            return reset();
        }
        if (tool == "get_scene_info")
        {
            return info();
        }
        throw SceneError("UnknownTool", fmt::format("Unknown tool: {}", tool));
    }

    std::string
    SceneState::createCube(std::string const & name, Position const & location, double size)
    {
        addObject({.name = name, .type = "MESH", .location = location, .size = size});
        return fmt::format("Created cube '{}' at [{}, {}, {}] with size {}",
                           name,
                           location[0],
                           location[1],
                           location[2],
                           size);
    }

    std::string
    SceneState::createSphere(std::string const & name, Position const & location, double radius)
    {
        addObject({.name = name, .type = "MESH", .location = location, .radius = radius});
        return fmt::format("Created sphere '{}' at [{}, {}, {}] with radius {}",
                           name,
                           location[0],
                           location[1],
                           location[2],
                           radius);
    }

    std::string SceneState::setMaterial(std::string const & objectName,
                                        std::string const & materialName,
                                        Rgba const & color)
    {
        auto object = std::find_if(m_objects.begin(),
                                   m_objects.end(),
                                   [&objectName](auto const & o) { return o.name == objectName; });
        if (object == m_objects.end())
        {
            throw SceneError("ObjectNotFound", fmt::format("Object '{}' not found", objectName));
        }

        auto material =
          std::find_if(m_materials.begin(),
                       m_materials.end(),
                       [&materialName](auto const & m) { return m.name == materialName; });
        if (material == m_materials.end())
        {
            m_materials.push_back({materialName, color});
        }
        else
        {
            material->color = color;
        }
        object->material = materialName;

        return fmt::format("Set material '{}' with color [{}, {}, {}, {}] on object '{}'",
                           materialName,
                           color[0],
                           color[1],
                           color[2],
                           color[3],
                           objectName);
    }

    json SceneState::renderImage(std::string const & filepath,
                                 int64_t resolutionX,
                                 int64_t resolutionY)
    {
        if (resolutionX <= 0 || resolutionY <= 0)
        {
            throw SceneError("InvalidArguments", "resolution must be positive");
        }
        auto const x = std::min<int64_t>(resolutionX, MAX_RENDER_RESOLUTION);
        auto const y = std::min<int64_t>(resolutionY, MAX_RENDER_RESOLUTION);
        return {{"filepath", filepath}, {"resolution", {x, y}}, {"format", "PNG"}};
    }

    std::string SceneState::reset()
    {
        m_objects.clear();
        m_materials.clear();
        m_activeObject.reset();
        return "Reset scene - cleared all objects";
    }

    json SceneState::info() const
    {
        json objectNames = json::array();
        for (auto const & object : m_objects)
        {
            objectNames.push_back(object.name);
        }
        json materialNames = json::array();
        for (auto const & material : m_materials)
        {
            materialNames.push_back(material.name);
        }

        return {{"scene_name", "Scene"},
                {"frame_current", 1},
                {"frame_start", 1},
                {"frame_end", 250},
                {"fps", 30},
                {"fps_base", 1},
                {"objects", objectNames},
                {"materials", materialNames},
                {"active_object", m_activeObject ? json(*m_activeObject) : json(nullptr)}};
    }

    SceneObject const * SceneState::findObject(std::string const & name) const
    {
        auto iter = std::find_if(
          m_objects.begin(), m_objects.end(), [&name](auto const & o) { return o.name == name; });
        return iter == m_objects.end() ? nullptr : &*iter;
    }

    void SceneState::addObject(SceneObject object)
    {
        std::erase_if(m_objects, [&object](auto const & o) { return o.name == object.name; });
        m_activeObject = object.name;
        m_objects.push_back(std::move(object));
    }
}
