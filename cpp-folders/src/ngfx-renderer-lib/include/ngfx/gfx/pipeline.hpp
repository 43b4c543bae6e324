#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: pipeline.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Pipeline-ийн fixed-function төлөв (blend/depth/stencil/cull/color mask)
            болон pipeline handle. Builder-ийн optional параметрүүд энд
            default утгатай талбар болж буусан.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include "ngfx/gfx/color.hpp"
#include "ngfx/gfx/drop_tracker.hpp"

namespace ngfx
{
    enum class DrawPrimitive : uint8_t
    {
        Triangles = 0,
        TriangleStrip = 1,
        Lines = 2,
        LineStrip = 3
    };

    // None = тест хийхгүй (depth-д disable гэсэн үг).
    enum class CompareMode : uint8_t
    {
        None = 0,
        Less,
        Equal,
        LEqual,
        Greater,
        NotEqual,
        GEqual,
        Always
    };

    enum class StencilAction : uint8_t
    {
        Keep = 0,
        Zero,
        Replace,
        Increment,
        IncrementWrap,
        Decrement,
        DecrementWrap,
        Invert
    };

    enum class CullMode : uint8_t
    {
        None = 0,
        Front = 1,
        Back = 2
    };

    enum class BlendFactor : uint8_t
    {
        Zero = 0,
        One,
        SourceAlpha,
        SourceColor,
        InverseSourceAlpha,
        InverseSourceColor,
        DestinationAlpha,
        DestinationColor,
        InverseDestinationAlpha,
        InverseDestinationColor
    };

    enum class BlendOperation : uint8_t
    {
        Add = 0,
        Subtract,
        ReverseSubtract,
        Max,
        Min
    };

    struct BlendMode
    {
        BlendFactor src = BlendFactor::One;
        BlendFactor dst = BlendFactor::Zero;
        BlendOperation op = BlendOperation::Add;

        friend constexpr bool operator==(const BlendMode&, const BlendMode&) = default;

        static const BlendMode NONE;
        static const BlendMode NORMAL;
        static const BlendMode ADD;
        static const BlendMode MULTIPLY;
        static const BlendMode SCREEN;
        static const BlendMode ERASE;
        static const BlendMode OVER;
    };

    inline constexpr BlendMode BlendMode::NONE{BlendFactor::One, BlendFactor::Zero, BlendOperation::Add};
    inline constexpr BlendMode BlendMode::NORMAL{BlendFactor::SourceAlpha, BlendFactor::InverseSourceAlpha, BlendOperation::Add};
    inline constexpr BlendMode BlendMode::ADD{BlendFactor::One, BlendFactor::One, BlendOperation::Add};
    inline constexpr BlendMode BlendMode::MULTIPLY{BlendFactor::DestinationColor, BlendFactor::InverseSourceAlpha, BlendOperation::Add};
    inline constexpr BlendMode BlendMode::SCREEN{BlendFactor::One, BlendFactor::InverseSourceColor, BlendOperation::Add};
    inline constexpr BlendMode BlendMode::ERASE{BlendFactor::Zero, BlendFactor::InverseSourceColor, BlendOperation::Add};
    inline constexpr BlendMode BlendMode::OVER{BlendFactor::One, BlendFactor::InverseSourceAlpha, BlendOperation::Add};

    struct StencilOptions
    {
        StencilAction stencil_fail = StencilAction::Keep;
        StencilAction depth_fail = StencilAction::Keep;
        StencilAction pass = StencilAction::Keep;
        CompareMode compare = CompareMode::Always;
        uint32_t read_mask = 0xff;
        uint32_t write_mask = 0;
        uint8_t reference = 0;

        friend constexpr bool operator==(const StencilOptions&, const StencilOptions&) = default;
    };

    struct DepthStencil
    {
        bool write = false;
        CompareMode compare = CompareMode::None;

        friend constexpr bool operator==(const DepthStencil&, const DepthStencil&) = default;
    };

    struct ColorMask
    {
        bool r = true;
        bool g = true;
        bool b = true;
        bool a = true;

        friend constexpr bool operator==(const ColorMask&, const ColorMask&) = default;

        static constexpr ColorMask all() { return ColorMask{true, true, true, true}; }
        static constexpr ColorMask none() { return ColorMask{false, false, false, false}; }
    };

    struct PipelineOptions
    {
        std::optional<BlendMode> color_blend{};
        std::optional<BlendMode> alpha_blend{};
        CullMode cull_mode = CullMode::None;
        DepthStencil depth_stencil{};
        ColorMask color_mask{};
        std::optional<StencilOptions> stencil{};
        DrawPrimitive primitive = DrawPrimitive::Triangles;

        friend bool operator==(const PipelineOptions&, const PipelineOptions&) = default;
    };

    // Stencil тохиргоо no-op бол (эсвэл огт байхгүй бол) тестийг бүр мөсөн унтраана.
    inline bool should_disable_stencil(const std::optional<StencilOptions>& stencil)
    {
        if (!stencil) return true;
        return stencil->compare == CompareMode::Always
            && stencil->stencil_fail == StencilAction::Keep
            && stencil->depth_fail == StencilAction::Keep
            && stencil->pass == StencilAction::Keep;
    }

    struct ResolvedBlend
    {
        bool enabled = false;
        BlendMode color{};
        BlendMode alpha{};
        // false үед color/alpha тэнцүү, нэг дуудлагаар хэрэглэнэ
        bool separate = false;
    };

    inline ResolvedBlend resolve_blend(const PipelineOptions& options)
    {
        ResolvedBlend out{};
        if (options.color_blend && !options.alpha_blend)
        {
            out.enabled = true;
            out.color = *options.color_blend;
            out.alpha = *options.color_blend;
        }
        else if (options.color_blend && options.alpha_blend)
        {
            out.enabled = true;
            out.color = *options.color_blend;
            out.alpha = *options.alpha_blend;
            out.separate = true;
        }
        else if (options.alpha_blend)
        {
            out.enabled = true;
            out.color = BlendMode::NORMAL;
            out.alpha = *options.alpha_blend;
            out.separate = true;
        }
        return out;
    }

    struct ClearOptions
    {
        std::optional<Color> color{};
        std::optional<float> depth{};
        std::optional<int32_t> stencil{};

        static ClearOptions none() { return ClearOptions{}; }
        static ClearOptions with_color(Color c) { return ClearOptions{c, std::nullopt, std::nullopt}; }
        static ClearOptions with_depth(float d) { return ClearOptions{std::nullopt, d, std::nullopt}; }
        static ClearOptions with_stencil(int32_t s) { return ClearOptions{std::nullopt, std::nullopt, s}; }
    };

    class Pipeline
    {
    public:
        Pipeline() = default;

        Pipeline(uint64_t id, uint32_t stride, PipelineOptions options, std::shared_ptr<DropTracker> tracker)
            : ref_(detail::make_resource_ref(ResourceId::pipeline(id), std::move(tracker)))
            , stride_(stride)
            , options_(std::move(options))
        {}

        bool valid() const { return ref_ != nullptr; }
        uint64_t id() const { return ref_ ? ref_->id().id : 0; }
        uint32_t stride() const { return stride_; }
        const PipelineOptions& options() const { return options_; }

        bool operator==(const Pipeline& other) const { return ref_ == other.ref_; }

    private:
        std::shared_ptr<const detail::ResourceRef> ref_{};
        uint32_t stride_ = 0;
        PipelineOptions options_{};
    };
}
