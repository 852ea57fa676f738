module;
#include <algorithm>
#include <glm/glm.hpp>

export module Graphics:Rect;

export namespace Graphics
{
    // Per-side padding, in pixels. Order follows CSS: top, right, bottom, left.
    struct Margin
    {
        float Top = 0.0f;
        float Right = 0.0f;
        float Bottom = 0.0f;
        float Left = 0.0f;

        static constexpr Margin Uniform(float v) { return {v, v, v, v}; }

        bool operator==(const Margin&) const = default;
    };

    // Axis-aligned rectangle, Min inclusive / Max inclusive.
    struct Rect
    {
        glm::vec2 Min{0.0f};
        glm::vec2 Max{0.0f};

        [[nodiscard]] static Rect FromXYWH(float x, float y, float w, float h)
        {
            return {{x, y}, {x + w, y + h}};
        }

        [[nodiscard]] float Width() const { return Max.x - Min.x; }
        [[nodiscard]] float Height() const { return Max.y - Min.y; }
        [[nodiscard]] bool IsEmpty() const { return Max.x <= Min.x || Max.y <= Min.y; }

        // Touching edges count as overlap.
        [[nodiscard]] bool Overlaps(const Rect& o) const
        {
            return Min.x <= o.Max.x && Max.x >= o.Min.x &&
                   Min.y <= o.Max.y && Max.y >= o.Min.y;
        }

        // Empty (zero-sized) result when the rectangles are disjoint.
        [[nodiscard]] Rect Intersect(const Rect& o) const
        {
            Rect r{glm::max(Min, o.Min), glm::min(Max, o.Max)};
            r.Max = glm::max(r.Max, r.Min);
            return r;
        }

        [[nodiscard]] Rect Expanded(const Margin& m) const
        {
            return {{Min.x - m.Left, Min.y - m.Top}, {Max.x + m.Right, Max.y + m.Bottom}};
        }

        bool operator==(const Rect&) const = default;
    };

    template <typename It>
    [[nodiscard]] Rect BoundsOf(It first, It last)
    {
        Rect r{*first, *first};
        for (; first != last; ++first)
        {
            r.Min = glm::min(r.Min, *first);
            r.Max = glm::max(r.Max, *first);
        }
        return r;
    }
}
