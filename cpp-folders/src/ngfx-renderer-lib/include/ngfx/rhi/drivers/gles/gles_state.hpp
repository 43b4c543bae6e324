#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: gles_state.hpp
    МОДУЛЬ: rhi/drivers/gles
    ЗОРИЛГО: Pipeline bind хийх үед fixed-function төлөвийг бүтнээр нь дахин тавина.
            Өмнөх pipeline-ийн үлдэгдэл төлөв дараагийнх руу алдагдахгүй.
*/


#include <optional>

#include "ngfx/gfx/pipeline.hpp"
#include "ngfx/rhi/drivers/gles/gles_api.hpp"
#include "ngfx/rhi/drivers/gles/gles_convert.hpp"

namespace ngfx::gles
{
    inline void apply_stencil(const GlesApi& gl, const std::optional<StencilOptions>& stencil)
    {
        if (should_disable_stencil(stencil))
        {
            gl.Disable(GL_STENCIL_TEST);
            return;
        }

        const StencilOptions& s = *stencil;
        gl.Enable(GL_STENCIL_TEST);
        gl.StencilMask((GLuint)s.write_mask);
        gl.StencilOp(to_gl(s.stencil_fail), to_gl(s.depth_fail), to_gl(s.pass));
        gl.StencilFunc(to_gl(s.compare), (GLint)s.reference, (GLuint)s.read_mask);
    }

    inline void apply_depth(const GlesApi& gl, const DepthStencil& depth)
    {
        if (depth.compare != CompareMode::None)
        {
            gl.Enable(GL_DEPTH_TEST);
            gl.DepthFunc(to_gl(depth.compare));
        }
        else
        {
            gl.Disable(GL_DEPTH_TEST);
        }
        gl.DepthMask(depth.write ? GL_TRUE : GL_FALSE);
    }

    inline void apply_color_mask(const GlesApi& gl, const ColorMask& mask)
    {
        gl.ColorMask(
            mask.r ? GL_TRUE : GL_FALSE,
            mask.g ? GL_TRUE : GL_FALSE,
            mask.b ? GL_TRUE : GL_FALSE,
            mask.a ? GL_TRUE : GL_FALSE);
    }

    inline void apply_cull(const GlesApi& gl, CullMode mode)
    {
        if (mode == CullMode::None)
        {
            gl.Disable(GL_CULL_FACE);
            return;
        }
        gl.Enable(GL_CULL_FACE);
        gl.CullFace(to_gl(mode));
    }

    inline void apply_blend(const GlesApi& gl, const PipelineOptions& options)
    {
        const ResolvedBlend blend = resolve_blend(options);
        if (!blend.enabled)
        {
            gl.Disable(GL_BLEND);
            return;
        }

        gl.Enable(GL_BLEND);
        if (blend.separate)
        {
            gl.BlendFuncSeparate(
                to_gl(blend.color.src), to_gl(blend.color.dst),
                to_gl(blend.alpha.src), to_gl(blend.alpha.dst));
            gl.BlendEquationSeparate(to_gl(blend.color.op), to_gl(blend.alpha.op));
        }
        else
        {
            gl.BlendFunc(to_gl(blend.color.src), to_gl(blend.color.dst));
            gl.BlendEquation(to_gl(blend.color.op));
        }
    }

    inline void apply_pipeline_state(const GlesApi& gl, const PipelineOptions& options)
    {
        apply_stencil(gl, options.stencil);
        apply_depth(gl, options.depth_stencil);
        apply_color_mask(gl, options.color_mask);
        apply_cull(gl, options.cull_mode);
        apply_blend(gl, options);
    }
}
