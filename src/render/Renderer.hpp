#pragma once
#include <cstdio>

#include "BarFormatter.hpp"

// how a frame relates to the previous one
struct Frame {
    bool first = false;       // nothing of this bar is on screen yet
    bool new_message = false; // label changed since the previous frame
    bool parallel = false;    // reporter of a parallel run, one line below the bar
};

class Renderer {
    public:
    explicit Renderer(FILE* out) : m_out(out) {}
    virtual ~Renderer() = default;

    // turns what is on screen into layout
    virtual void draw(const Layout& layout, const Frame& frame) = 0;

    // removes the bar, leaves the cursor where the bar started
    virtual void erase(bool parallel) = 0;

    protected:
    void emit(const std::string& data) const;

    FILE* m_out;
};
