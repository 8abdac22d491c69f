#ifndef BAR_GRAPH_RENDERER_HPP
#define BAR_GRAPH_RENDERER_HPP

#include "PhaseContext.hpp"
#include <ostream>
#include <string>

class CancellationToken;

/**
 * @brief  Draws one phase as a bar that fills up over the phase duration.
 *
 *  Output for caption "IN " and 5 columns, over time:
 *
 *      IN  [     ]\rIN  [#
 *      IN  [##
 *      ...
 *      IN  [#####]\n
 *
 *  The empty outline goes out first so the closing bracket is already in
 *  place; a carriage return (not a clear) brings the cursor back and the
 *  fill characters overwrite the blanks. Only "\r" is needed from the
 *  terminal, so the bar width never changes mid-phase.
 *
 *  render() blocks for the whole phase.
 */
class BarGraphRenderer {
public:
    BarGraphRenderer(std::ostream& out, int columns, char fill = '#');

    /**
     * @brief Draw and pace one full bar.
     *
     *  One fill character, flush, then one perColumn wait, `columns` times.
     *
     * @return true when the bar completed, false if the token was cancelled
     *         part way through. A cancelled bar is left as it is on screen,
     *         without the line terminator.
     */
    bool render(const PhaseContext& ctx, CancellationToken& token);

    // caption + " [" + columns blanks + "]"
    std::string outline(const std::string& caption) const;

    int getColumns() const { return columns_; }
    int getFilled() const { return filled_; }

private:
    std::ostream& out_;
    int columns_;
    char fill_;
    int filled_ = 0;        // fill characters drawn in the current bar
};

#endif  // BAR_GRAPH_RENDERER_HPP
