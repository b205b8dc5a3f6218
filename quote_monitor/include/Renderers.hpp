#pragma once
#include "IRenderer.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/* ================= Console table ================= */

class ConsoleRenderer : public IRenderer {
public:
    explicit ConsoleRenderer(std::ostream& out = std::cout, bool clear_screen = true);

    void render(const RenderSnapshot& snap) override;

    // The whole frame as text, without the clear-screen prefix
    static std::string format_frame(const RenderSnapshot& snap);

private:
    std::ostream& out_;
    bool clear_screen_;
};

/* ================= Fan-out ================= */

// One failing renderer does not starve the others
class RendererFanout : public IRenderer {
public:
    void add(std::unique_ptr<IRenderer> r) { renderers_.push_back(std::move(r)); }
    std::size_t size() const { return renderers_.size(); }

    void render(const RenderSnapshot& snap) override;

private:
    std::vector<std::unique_ptr<IRenderer>> renderers_;
};
