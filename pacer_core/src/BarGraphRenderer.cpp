#include "BarGraphRenderer.hpp"
#include "CancellationToken.hpp"

BarGraphRenderer::BarGraphRenderer(std::ostream& out, int columns, char fill)
    : out_(out), columns_(columns), fill_(fill) {}

std::string BarGraphRenderer::outline(const std::string& caption) const {
    return caption + " [" + std::string(static_cast<std::size_t>(columns_), ' ') + "]";
}

bool BarGraphRenderer::render(const PhaseContext& ctx, CancellationToken& token) {
    filled_ = 0;
    if (token.isCancelled()) return false;

    // Outline first, then back to column 0 without erasing the "]"
    out_ << outline(ctx.caption) << "\r" << ctx.caption << " [";
    out_.flush();

    while (filled_ < columns_) {
        if (token.isCancelled()) return false;
        out_ << fill_;
        out_.flush();
        filled_++;
        if (!token.waitFor(ctx.delay.perColumn)) return false;
    }

    out_ << "\n";
    out_.flush();
    return true;
}
