#include "SceneTools.h"
#include "PromptRegistry.h"
#include "ResourceRegistry.h"
#include "ToolRegistry.h"

using json = nlohmann::json;

namespace scenemcp::mcp
{
    void registerSceneTools(ToolRegistry & registry)
    {
        registry.registerTool(
          {.name = "create_cube",
           .description = "Create a cube object in the scene",
           .parameters = {{"name",
                           SemanticType::String,
                           false,
                           json("Cube"),
                           "Name for the cube object"},
                          {"location",
                           SemanticType::Vector3,
                           false,
                           json::array({0., 0., 0.}),
                           "Location as [x, y, z] coordinates"},
                          {"size", SemanticType::Number, false, json(2.0), "Size of the cube"}},
           .handler = "create_cube"});

        registry.registerTool(
          {.name = "create_sphere",
           .description = "Create a sphere object in the scene",
           .parameters = {{"name",
                           SemanticType::String,
                           false,
                           json("Sphere"),
                           "Name for the sphere object"},
                          {"location",
                           SemanticType::Vector3,
                           false,
                           json::array({0., 0., 0.}),
                           "Location as [x, y, z] coordinates"},
                          {"radius",
                           SemanticType::Number,
                           false,
                           json(1.0),
                           "Radius of the sphere"}},
           .handler = "create_sphere"});

        registry.registerTool(
          {.name = "set_material",
           .description = "Set material on an object",
           .parameters = {{"object_name",
                           SemanticType::String,
                           true,
                           std::nullopt,
                           "Name of the object to assign the material to"},
                          {"material_name",
                           SemanticType::String,
                           false,
                           json("Material"),
                           "Name of the material"},
                          {"color",
                           SemanticType::Color,
                           false,
                           json::array({0.8, 0.8, 0.8, 1.0}),
                           "RGBA color, components in [0, 1]"}},
           .handler = "set_material"});

        registry.registerTool(
          {.name = "render_image",
           .description = "Render the current scene to an image file",
           .parameters = {{"filepath",
                           SemanticType::String,
                           true,
                           std::nullopt,
                           "Output path of the rendered image"},
                          {"resolution_x",
                           SemanticType::Integer,
                           false,
                           json(1920),
                           "Horizontal resolution in pixels"},
                          {"resolution_y",
                           SemanticType::Integer,
                           false,
                           json(1080),
                           "Vertical resolution in pixels"}},
           .handler = "render_image"});

        registry.registerTool({.name = "reset_scene",
                               .description = "Resets the scene to a clean state",
                               .parameters = {},
                               .handler = "reset_scene"});

        registry.registerTool({.name = "get_scene_info",
                               .description = "Get information about the current scene",
                               .parameters = {},
                               .handler = "get_scene_info"});
    }

    void registerScenePrompts(PromptRegistry & registry)
    {
        registry.registerPrompt(
          {.name = "basic_scene_setup",
           .description = "Basic scene setup: create a simple scene with a few objects",
           .arguments = {},
           .text = "Build a basic scene with the scene tools.\n"
                   "1. Call reset_scene to start from an empty scene.\n"
                   "2. Create cubes named Cube1, Cube2 and Cube3 at [0, 0, 0], [3, 0, 0] and "
                   "[6, 0, 0] with create_cube (size 2).\n"
                   "3. Create spheres named Sphere1 and Sphere2 at [0, 3, 0] and [3, 3, 0] "
                   "with create_sphere (radius 1).\n"
                   "4. Call get_scene_info and confirm the scene lists all five objects."});

        registry.registerPrompt(
          {.name = "cube_grid_plan",
           .description = "Create a grid of cubes row by row",
           .arguments = {{"rows", "Number of rows", false, "3"},
                         {"columns", "Number of columns", false, "3"},
                         {"spacing", "Distance between neighbouring cubes", false, "2"}},
           .text = "Create a grid of {{rows}} by {{columns}} cubes in the XY plane with "
                   "create_cube, {{spacing}} units apart.\n"
                   "Create the rows in order, and each row from left to right. Name the cubes "
                   "Cube_<row>_<column> starting at Cube_0_0 at [0, 0, 0].\n"
                   "Finish with get_scene_info to verify the object count."});

        registry.registerPrompt(
          {.name = "sphere_pattern_plan",
           .description = "Create spheres in a circular pattern",
           .arguments = {{"count", "Number of spheres", true},
                         {"radius", "Radius of the circle", true}},
           .text = "Place {{count}} spheres evenly on a circle of radius {{radius}} around the "
                   "origin in the XY plane with create_sphere.\n"
                   "Name them Sphere_0 upwards, counter-clockwise starting on the positive X "
                   "axis, and give each a radius of 0.5."});

        registry.registerPrompt(
          {.name = "material_showcase",
           .description = "Assign materials to the objects of the scene and render it",
           .arguments = {{"filepath", "Output path of the rendered image", true}},
           .text = "Call get_scene_info to list the objects of the scene.\n"
                   "Give every object its own material with set_material, using distinct "
                   "RGBA colors with components in [0, 1].\n"
                   "Render the result to {{filepath}} with render_image at 1920x1080."});
    }

    void registerSceneResources(ResourceRegistry & registry)
    {
        registry.registerResource({.uri = "scene://info",
                                   .name = "Scene information",
                                   .description = "Objects, materials and frame settings of "
                                                  "the current scene",
                                   .mimeType = "application/json",
                                   .tool = "get_scene_info"});
    }
}
