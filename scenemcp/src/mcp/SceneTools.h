#pragma once

namespace scenemcp::mcp
{
    class PromptRegistry;
    class ResourceRegistry;
    class ToolRegistry;

    /// Register create_cube, create_sphere, set_material, render_image, reset_scene and
    /// get_scene_info
    void registerSceneTools(ToolRegistry & registry);

    /// Seed prompts describing common scene construction workflows
    void registerScenePrompts(PromptRegistry & registry);

    /// scene://info, backed by get_scene_info
    void registerSceneResources(ResourceRegistry & registry);
}
