#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

#include "wikirace/core/cursor/codec.hpp"
#include "wikirace/core/cursor/layout.hpp"
#include "wikirace/core/notify/color.hpp"
#include "wikirace/core/protocol/cursor_type.hpp"
#include "wikirace/core/protocol/schema/server.hpp"
#include "lcr/optional.hpp"


namespace wikirace::core::cursor {

// One remote player's cursor: the latest wire sample plus the smoothed
// on-screen position derived from it.
struct RemoteCursor {
    std::string player_id;
    std::string player_name;
    std::string article;
    Locator target;
    lcr::optional<protocol::CursorType> cursor_type;
    notify::Rgb color;

    bool visible{false};
    bool has_position{false};
    double x{0.0};
    double y{0.0};
    Tier tier{Tier::Fallback};
};

// What the presentation layer draws for one cursor this frame.
// Owns its strings; `icon` points into the process-wide IconCache.
struct RenderInstruction {
    std::string player_id;
    std::string player_name;
    double x{0.0};
    double y{0.0};
    bool visible{false};
    protocol::CursorType cursor_type{protocol::CursorType::Pointer};
    std::string_view icon;
    notify::Rgb color;
};

/*
===============================================================================
 RemotePool
===============================================================================
Owns the visuals of every remote cursor, indexed by player id and kept
outside of room state:

  - update()  last-value-wins per sender; creates the entry on first sample
  - remove()  drops a player's cursor (player left the room)
  - tick()    one animation frame: decode every visible target against the
              local layout and move the displayed position LERP_FACTOR of the
              way there. A width change > 1 px snaps every cursor to its
              target instead of interpolating across the resize.

Cursors whose article differs from the local article are hidden and keep
their last displayed position.
===============================================================================
*/
class RemotePool {
public:
    RemotePool() = default;

    void update(const protocol::schema::CursorUpdate& msg);
    bool remove(std::string_view player_id);

    // Drops cursors whose id is absent from `players`
    template<typename Map>
    std::size_t retain(const Map& players) {
        std::size_t removed = 0;
        for (auto it = cursors_.begin(); it != cursors_.end();) {
            if (players.find(it->first) == players.end()) {
                it = cursors_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void set_local_article(std::string_view article);
    [[nodiscard]] const std::string& local_article() const noexcept { return local_article_; }

    void tick(const Layout& layout);

    [[nodiscard]] std::vector<RenderInstruction> render() const;

    [[nodiscard]] const RemoteCursor* find(std::string_view player_id) const;
    [[nodiscard]] std::size_t size() const noexcept { return cursors_.size(); }

    void clear() noexcept;

private:
    std::map<std::string, RemoteCursor, std::less<>> cursors_;
    std::string local_article_;
    double last_width_{0.0};
};

} // namespace wikirace::core::cursor
