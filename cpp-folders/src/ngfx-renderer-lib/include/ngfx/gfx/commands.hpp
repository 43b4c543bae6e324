#pragma once

/*
    NGFX RENDERER SAN

    FILE: commands.hpp
    MODULE: gfx
    PURPOSE: Closed set of recorded drawing operations.
            A command list is an ordered vector of these variants; recorded order is execution order.
*/


#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "ngfx/gfx/color.hpp"
#include "ngfx/gfx/pipeline.hpp"

namespace ngfx
{
    struct CmdBegin
    {
        std::optional<Color> color{};
        std::optional<float> depth{};
        std::optional<int32_t> stencil{};
    };

    struct CmdEnd
    {
    };

    struct CmdSetPipeline
    {
        uint64_t id = 0;
        PipelineOptions options{};
    };

    struct CmdBindBuffer
    {
        uint64_t id = 0;
    };

    struct CmdDraw
    {
        DrawPrimitive primitive = DrawPrimitive::Triangles;
        int32_t offset = 0;
        int32_t count = 0;
    };

    struct CmdDrawInstanced
    {
        DrawPrimitive primitive = DrawPrimitive::Triangles;
        int32_t offset = 0;
        int32_t count = 0;
        int32_t instance_count = 0;
    };

    // location = pipeline-ийн кэшлэсэн uniform location жагсаалтын индекс
    struct CmdBindTexture
    {
        uint64_t id = 0;
        uint32_t slot = 0;
        uint32_t location = 0;
    };

    struct CmdSetSize
    {
        int32_t width = 0;
        int32_t height = 0;
    };

    struct CmdSetViewport
    {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
    };

    struct CmdSetScissor
    {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
    };

    using Command = std::variant<
        CmdBegin,
        CmdEnd,
        CmdSetPipeline,
        CmdBindBuffer,
        CmdDraw,
        CmdDrawInstanced,
        CmdBindTexture,
        CmdSetSize,
        CmdSetViewport,
        CmdSetScissor>;

    using CommandList = std::vector<Command>;

    namespace detail
    {
        struct CommandNameVisitor
        {
            const char* operator()(const CmdBegin&) const { return "begin"; }
            const char* operator()(const CmdEnd&) const { return "end"; }
            const char* operator()(const CmdSetPipeline&) const { return "set_pipeline"; }
            const char* operator()(const CmdBindBuffer&) const { return "bind_buffer"; }
            const char* operator()(const CmdDraw&) const { return "draw"; }
            const char* operator()(const CmdDrawInstanced&) const { return "draw_instanced"; }
            const char* operator()(const CmdBindTexture&) const { return "bind_texture"; }
            const char* operator()(const CmdSetSize&) const { return "set_size"; }
            const char* operator()(const CmdSetViewport&) const { return "set_viewport"; }
            const char* operator()(const CmdSetScissor&) const { return "set_scissor"; }
        };
    }

    inline const char* command_name(const Command& cmd)
    {
        return std::visit(detail::CommandNameVisitor{}, cmd);
    }
}
