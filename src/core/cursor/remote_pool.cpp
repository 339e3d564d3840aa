#include "wikirace/core/cursor/remote_pool.hpp"

#include <cmath>

#include "wikirace/core/cursor/icon_cache.hpp"
#include "wikirace/core/config/cursor.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core::cursor {

void RemotePool::update(const protocol::schema::CursorUpdate& msg) {
    auto it = cursors_.find(msg.player_id);
    if (it == cursors_.end()) {
        RemoteCursor fresh;
        fresh.player_id = msg.player_id;
        fresh.color = notify::player_color(msg.player_name);
        it = cursors_.emplace(msg.player_id, std::move(fresh)).first;
        WR_DEBUG("[CURSOR] New remote cursor for player " << msg.player_id << " (" << msg.player_name << ")");
    }
    RemoteCursor& c = it->second;
    if (c.player_name != msg.player_name) {
        c.player_name = msg.player_name;
        c.color = notify::player_color(msg.player_name);
    }
    c.article = msg.article;
    c.target.x = msg.x;
    c.target.y = msg.y;
    c.target.anchor_id = msg.anchor_id;
    c.target.next_anchor_id = msg.next_anchor_id;
    c.target.section_ratio = msg.section_ratio;
    c.cursor_type = msg.cursor_type;
    c.visible = (c.article == local_article_);
}

bool RemotePool::remove(std::string_view player_id) {
    auto it = cursors_.find(player_id);
    if (it == cursors_.end()) {
        return false;
    }
    cursors_.erase(it);
    WR_DEBUG("[CURSOR] Removed remote cursor for player " << player_id);
    return true;
}

void RemotePool::set_local_article(std::string_view article) {
    local_article_.assign(article.data(), article.size());
    for (auto& [id, c] : cursors_) {
        c.visible = (c.article == local_article_);
    }
}

void RemotePool::tick(const Layout& layout) {
    if (last_width_ > 0.0 && std::abs(layout.width - last_width_) > config::cursor::RESIZE_RESET_THRESHOLD_PX) {
        WR_TRACE("[CURSOR] Content width changed " << last_width_ << " -> " << layout.width << ", snapping cursors");
        for (auto& [id, c] : cursors_) {
            c.has_position = false;
        }
    }
    last_width_ = layout.width;

    for (auto& [id, c] : cursors_) {
        c.visible = (c.article == local_article_);
        if (!c.visible) {
            continue;
        }
        const Position target = decode(layout, c.target);
        c.tier = target.tier;
        if (!c.has_position) {
            c.x = target.x;
            c.y = target.y;
            c.has_position = true;
        }
        c.x += (target.x - c.x) * config::cursor::LERP_FACTOR;
        c.y += (target.y - c.y) * config::cursor::LERP_FACTOR;
    }
}

std::vector<RenderInstruction> RemotePool::render() const {
    std::vector<RenderInstruction> out;
    out.reserve(cursors_.size());
    auto& icons = IconCache::instance();
    for (const auto& [id, c] : cursors_) {
        RenderInstruction ri;
        ri.player_id = c.player_id;
        ri.player_name = c.player_name;
        ri.x = c.x;
        ri.y = c.y;
        ri.visible = c.visible && c.has_position;
        ri.cursor_type = c.cursor_type.value_or(protocol::CursorType::Pointer);
        ri.icon = icons.markup(ri.cursor_type);
        ri.color = c.color;
        out.push_back(ri);
    }
    return out;
}

const RemoteCursor* RemotePool::find(std::string_view player_id) const {
    auto it = cursors_.find(player_id);
    return (it == cursors_.end()) ? nullptr : &it->second;
}

void RemotePool::clear() noexcept {
    cursors_.clear();
    last_width_ = 0.0;
}

} // namespace wikirace::core::cursor
