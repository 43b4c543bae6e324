#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: gles_api.hpp
    МОДУЛЬ: rhi/drivers/gles
    ЗОРИЛГО: OpenGL ES 3.0 entry point хүснэгт. Функц бүрийг гаднаас өгсөн
            resolver-оор (SDL_GL_GetProcAddress, EGL, тестийн fake) ачаална.
            GL library-тай link хийхгүй, зөвхөн header-ийн PFN төрлүүдийг хэрэглэнэ.
*/


#ifndef GL_GLES_PROTOTYPES
#define GL_GLES_PROTOTYPES 0
#endif
#include <GLES3/gl3.h>

#include <functional>
#include <string>

#include "ngfx/core/result.hpp"

// X(member, gl-name, pfn-type)
#define NGFX_GLES_FUNCTIONS(X) \
    X(GetIntegerv, "glGetIntegerv", PFNGLGETINTEGERVPROC) \
    X(GetError, "glGetError", PFNGLGETERRORPROC) \
    X(Enable, "glEnable", PFNGLENABLEPROC) \
    X(Disable, "glDisable", PFNGLDISABLEPROC) \
    X(Viewport, "glViewport", PFNGLVIEWPORTPROC) \
    X(Scissor, "glScissor", PFNGLSCISSORPROC) \
    X(ClearColor, "glClearColor", PFNGLCLEARCOLORPROC) \
    X(ClearDepthf, "glClearDepthf", PFNGLCLEARDEPTHFPROC) \
    X(ClearStencil, "glClearStencil", PFNGLCLEARSTENCILPROC) \
    X(Clear, "glClear", PFNGLCLEARPROC) \
    X(DepthMask, "glDepthMask", PFNGLDEPTHMASKPROC) \
    X(DepthFunc, "glDepthFunc", PFNGLDEPTHFUNCPROC) \
    X(StencilMask, "glStencilMask", PFNGLSTENCILMASKPROC) \
    X(StencilOp, "glStencilOp", PFNGLSTENCILOPPROC) \
    X(StencilFunc, "glStencilFunc", PFNGLSTENCILFUNCPROC) \
    X(ColorMask, "glColorMask", PFNGLCOLORMASKPROC) \
    X(CullFace, "glCullFace", PFNGLCULLFACEPROC) \
    X(BlendFunc, "glBlendFunc", PFNGLBLENDFUNCPROC) \
    X(BlendFuncSeparate, "glBlendFuncSeparate", PFNGLBLENDFUNCSEPARATEPROC) \
    X(BlendEquation, "glBlendEquation", PFNGLBLENDEQUATIONPROC) \
    X(BlendEquationSeparate, "glBlendEquationSeparate", PFNGLBLENDEQUATIONSEPARATEPROC) \
    X(GenBuffers, "glGenBuffers", PFNGLGENBUFFERSPROC) \
    X(DeleteBuffers, "glDeleteBuffers", PFNGLDELETEBUFFERSPROC) \
    X(BindBuffer, "glBindBuffer", PFNGLBINDBUFFERPROC) \
    X(BindBufferBase, "glBindBufferBase", PFNGLBINDBUFFERBASEPROC) \
    X(BufferData, "glBufferData", PFNGLBUFFERDATAPROC) \
    X(BufferSubData, "glBufferSubData", PFNGLBUFFERSUBDATAPROC) \
    X(GenVertexArrays, "glGenVertexArrays", PFNGLGENVERTEXARRAYSPROC) \
    X(DeleteVertexArrays, "glDeleteVertexArrays", PFNGLDELETEVERTEXARRAYSPROC) \
    X(BindVertexArray, "glBindVertexArray", PFNGLBINDVERTEXARRAYPROC) \
    X(EnableVertexAttribArray, "glEnableVertexAttribArray", PFNGLENABLEVERTEXATTRIBARRAYPROC) \
    X(VertexAttribPointer, "glVertexAttribPointer", PFNGLVERTEXATTRIBPOINTERPROC) \
    X(VertexAttribDivisor, "glVertexAttribDivisor", PFNGLVERTEXATTRIBDIVISORPROC) \
    X(CreateShader, "glCreateShader", PFNGLCREATESHADERPROC) \
    X(ShaderSource, "glShaderSource", PFNGLSHADERSOURCEPROC) \
    X(CompileShader, "glCompileShader", PFNGLCOMPILESHADERPROC) \
    X(GetShaderiv, "glGetShaderiv", PFNGLGETSHADERIVPROC) \
    X(GetShaderInfoLog, "glGetShaderInfoLog", PFNGLGETSHADERINFOLOGPROC) \
    X(DeleteShader, "glDeleteShader", PFNGLDELETESHADERPROC) \
    X(CreateProgram, "glCreateProgram", PFNGLCREATEPROGRAMPROC) \
    X(AttachShader, "glAttachShader", PFNGLATTACHSHADERPROC) \
    X(LinkProgram, "glLinkProgram", PFNGLLINKPROGRAMPROC) \
    X(GetProgramiv, "glGetProgramiv", PFNGLGETPROGRAMIVPROC) \
    X(GetProgramInfoLog, "glGetProgramInfoLog", PFNGLGETPROGRAMINFOLOGPROC) \
    X(DeleteProgram, "glDeleteProgram", PFNGLDELETEPROGRAMPROC) \
    X(UseProgram, "glUseProgram", PFNGLUSEPROGRAMPROC) \
    X(GetActiveUniform, "glGetActiveUniform", PFNGLGETACTIVEUNIFORMPROC) \
    X(GetUniformLocation, "glGetUniformLocation", PFNGLGETUNIFORMLOCATIONPROC) \
    X(GetUniformBlockIndex, "glGetUniformBlockIndex", PFNGLGETUNIFORMBLOCKINDEXPROC) \
    X(UniformBlockBinding, "glUniformBlockBinding", PFNGLUNIFORMBLOCKBINDINGPROC) \
    X(Uniform1i, "glUniform1i", PFNGLUNIFORM1IPROC) \
    X(GenTextures, "glGenTextures", PFNGLGENTEXTURESPROC) \
    X(DeleteTextures, "glDeleteTextures", PFNGLDELETETEXTURESPROC) \
    X(BindTexture, "glBindTexture", PFNGLBINDTEXTUREPROC) \
    X(ActiveTexture, "glActiveTexture", PFNGLACTIVETEXTUREPROC) \
    X(TexParameteri, "glTexParameteri", PFNGLTEXPARAMETERIPROC) \
    X(TexImage2D, "glTexImage2D", PFNGLTEXIMAGE2DPROC) \
    X(TexSubImage2D, "glTexSubImage2D", PFNGLTEXSUBIMAGE2DPROC) \
    X(PixelStorei, "glPixelStorei", PFNGLPIXELSTOREIPROC) \
    X(GenFramebuffers, "glGenFramebuffers", PFNGLGENFRAMEBUFFERSPROC) \
    X(DeleteFramebuffers, "glDeleteFramebuffers", PFNGLDELETEFRAMEBUFFERSPROC) \
    X(BindFramebuffer, "glBindFramebuffer", PFNGLBINDFRAMEBUFFERPROC) \
    X(FramebufferTexture2D, "glFramebufferTexture2D", PFNGLFRAMEBUFFERTEXTURE2DPROC) \
    X(CheckFramebufferStatus, "glCheckFramebufferStatus", PFNGLCHECKFRAMEBUFFERSTATUSPROC) \
    X(ReadPixels, "glReadPixels", PFNGLREADPIXELSPROC) \
    X(DrawArrays, "glDrawArrays", PFNGLDRAWARRAYSPROC) \
    X(DrawElements, "glDrawElements", PFNGLDRAWELEMENTSPROC) \
    X(DrawArraysInstanced, "glDrawArraysInstanced", PFNGLDRAWARRAYSINSTANCEDPROC) \
    X(DrawElementsInstanced, "glDrawElementsInstanced", PFNGLDRAWELEMENTSINSTANCEDPROC)

namespace ngfx
{
    using GlesLoader = std::function<void*(const char*)>;

    struct GlesApi
    {
#define NGFX_GLES_MEMBER(member, gl_name, pfn) pfn member = nullptr;
        NGFX_GLES_FUNCTIONS(NGFX_GLES_MEMBER)
#undef NGFX_GLES_MEMBER
    };

    // Бүх entry point олдох ёстой. Олдоогүй нэрсийг нэг алдаанд жагсаана.
    inline Result<GlesApi> load_gles_api(const GlesLoader& loader)
    {
        if (!loader) return Result<GlesApi>::failure("OpenGL ES loader is empty.");

        GlesApi api{};
        std::string missing{};
#define NGFX_GLES_LOAD(member, gl_name, pfn) \
        api.member = reinterpret_cast<pfn>(loader(gl_name)); \
        if (!api.member) \
        { \
            if (!missing.empty()) missing += ", "; \
            missing += gl_name; \
        }
        NGFX_GLES_FUNCTIONS(NGFX_GLES_LOAD)
#undef NGFX_GLES_LOAD

        if (!missing.empty())
        {
            return Result<GlesApi>::failure("Missing OpenGL ES entry points: " + missing);
        }
        return Result<GlesApi>::success(api);
    }
}
