#pragma once

/*
    NGFX RENDERER SAN

    FILE: gles_convert.hpp
    MODULE: rhi/drivers/gles
    PURPOSE: ngfx enum -> GLenum mapping for draw, depth/stencil, blend, cull and texture state.
*/


#include "ngfx/gfx/buffer.hpp"
#include "ngfx/gfx/pipeline.hpp"
#include "ngfx/gfx/texture.hpp"
#include "ngfx/rhi/drivers/gles/gles_api.hpp"

namespace ngfx::gles
{
    inline GLenum to_gl(DrawPrimitive p)
    {
        switch (p)
        {
            case DrawPrimitive::Triangles: return GL_TRIANGLES;
            case DrawPrimitive::TriangleStrip: return GL_TRIANGLE_STRIP;
            case DrawPrimitive::Lines: return GL_LINES;
            case DrawPrimitive::LineStrip: return GL_LINE_STRIP;
        }
        return GL_TRIANGLES;
    }

    // None нь depth test унтраалттай үед л утгагүй, GL_ALWAYS гэж үзнэ.
    inline GLenum to_gl(CompareMode c)
    {
        switch (c)
        {
            case CompareMode::None: return GL_ALWAYS;
            case CompareMode::Less: return GL_LESS;
            case CompareMode::Equal: return GL_EQUAL;
            case CompareMode::LEqual: return GL_LEQUAL;
            case CompareMode::Greater: return GL_GREATER;
            case CompareMode::NotEqual: return GL_NOTEQUAL;
            case CompareMode::GEqual: return GL_GEQUAL;
            case CompareMode::Always: return GL_ALWAYS;
        }
        return GL_ALWAYS;
    }

    inline GLenum to_gl(StencilAction a)
    {
        switch (a)
        {
            case StencilAction::Keep: return GL_KEEP;
            case StencilAction::Zero: return GL_ZERO;
            case StencilAction::Replace: return GL_REPLACE;
            case StencilAction::Increment: return GL_INCR;
            case StencilAction::IncrementWrap: return GL_INCR_WRAP;
            case StencilAction::Decrement: return GL_DECR;
            case StencilAction::DecrementWrap: return GL_DECR_WRAP;
            case StencilAction::Invert: return GL_INVERT;
        }
        return GL_KEEP;
    }

    inline GLenum to_gl(CullMode m)
    {
        switch (m)
        {
            case CullMode::Front: return GL_FRONT;
            case CullMode::Back: return GL_BACK;
            case CullMode::None: break;
        }
        return GL_BACK;
    }

    inline GLenum to_gl(BlendFactor f)
    {
        switch (f)
        {
            case BlendFactor::Zero: return GL_ZERO;
            case BlendFactor::One: return GL_ONE;
            case BlendFactor::SourceAlpha: return GL_SRC_ALPHA;
            case BlendFactor::SourceColor: return GL_SRC_COLOR;
            case BlendFactor::InverseSourceAlpha: return GL_ONE_MINUS_SRC_ALPHA;
            case BlendFactor::InverseSourceColor: return GL_ONE_MINUS_SRC_COLOR;
            case BlendFactor::DestinationAlpha: return GL_DST_ALPHA;
            case BlendFactor::DestinationColor: return GL_DST_COLOR;
            case BlendFactor::InverseDestinationAlpha: return GL_ONE_MINUS_DST_ALPHA;
            case BlendFactor::InverseDestinationColor: return GL_ONE_MINUS_DST_COLOR;
        }
        return GL_ONE;
    }

    inline GLenum to_gl(BlendOperation op)
    {
        switch (op)
        {
            case BlendOperation::Add: return GL_FUNC_ADD;
            case BlendOperation::Subtract: return GL_FUNC_SUBTRACT;
            case BlendOperation::ReverseSubtract: return GL_FUNC_REVERSE_SUBTRACT;
            case BlendOperation::Max: return GL_MAX;
            case BlendOperation::Min: return GL_MIN;
        }
        return GL_FUNC_ADD;
    }

    inline GLenum to_gl(TextureFilter f)
    {
        return f == TextureFilter::Nearest ? GL_NEAREST : GL_LINEAR;
    }

    // Upload/read format (glTexImage2D-ийн format, glReadPixels-ийн format).
    inline GLenum to_gl_format(TextureFormat f)
    {
        switch (f)
        {
            case TextureFormat::Rgba32: return GL_RGBA;
            case TextureFormat::R8: return GL_RED;
            case TextureFormat::Depth16: return GL_DEPTH_COMPONENT;
        }
        return GL_RGBA;
    }

    inline GLint to_gl_internal_format(TextureFormat f)
    {
        switch (f)
        {
            case TextureFormat::Rgba32: return GL_RGBA8;
            case TextureFormat::R8: return GL_R8;
            case TextureFormat::Depth16: return GL_DEPTH_COMPONENT16;
        }
        return GL_RGBA8;
    }

    inline GLenum to_gl_pixel_type(TextureFormat f)
    {
        return f == TextureFormat::Depth16 ? GL_UNSIGNED_SHORT : GL_UNSIGNED_BYTE;
    }

    inline GLenum to_gl_attr_type(VertexFormat f)
    {
        return vertex_format_is_float(f) ? GL_FLOAT : GL_UNSIGNED_BYTE;
    }

    inline const char* gl_error_name(GLenum err)
    {
        switch (err)
        {
            case GL_NO_ERROR: return "GL_NO_ERROR";
            case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
            case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
            case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
            case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
            case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
            default: break;
        }
        return "GL_UNKNOWN_ERROR";
    }
}
