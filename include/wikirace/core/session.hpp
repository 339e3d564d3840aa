/*
===============================================================================
wikirace::core::Session
===============================================================================

One race session as seen by one player: the composition root of the core.

  - transport::Connection<WS>   one persistent connection, no auto-reconnect
  - protocol::parser::Router    typed inbound dispatch, arrival order kept
  - room::Store                 server-reconciled room mirror
  - race::Timer                 local finish + grace-period countdown
  - race::SplitTracker          speedrun segments of the local player
  - notify::MeetingNotifier     deduplicated same-page / finish notices
  - cursor::SendThrottle        outgoing cursor rate control
  - cursor::RemotePool          remote cursor visuals, keyed by player id

All long-lived mutable state of a race (local id, last sent cursor,
meetings, countdown) lives here as plain fields. Nothing runs in the
background: progress happens inside poll(now) and the explicit user-event
entry points (navigate, pointer_move, ...), all on the caller's thread.

Observers are invoked synchronously from those calls. An exception thrown
by an observer propagates out of that call; frames not yet drained stay
queued for the next poll().

Teardown: the destructor closes the connection WITHOUT sending leave_room.
===============================================================================
*/

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "wikirace/core/clock.hpp"
#include "wikirace/core/config/endpoint.hpp"
#include "wikirace/core/config/race.hpp"
#include "wikirace/core/transport/connection.hpp"
#include "wikirace/core/protocol/json_writable.hpp"
#include "wikirace/core/protocol/schema/requests.hpp"
#include "wikirace/core/protocol/schema/server.hpp"
#include "wikirace/core/protocol/parser/router.hpp"
#include "wikirace/core/room/store.hpp"
#include "wikirace/core/race/timer.hpp"
#include "wikirace/core/race/splits.hpp"
#include "wikirace/core/race/scoreboard.hpp"
#include "wikirace/core/race/title.hpp"
#include "wikirace/core/notify/notifier.hpp"
#include "wikirace/core/cursor/codec.hpp"
#include "wikirace/core/cursor/affordance.hpp"
#include "wikirace/core/cursor/send_throttle.hpp"
#include "wikirace/core/cursor/remote_pool.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace wikirace::core {

// Local outcome handed to the results view
struct Results {
    bool finished{false};                     // false: forced out by the countdown
    lcr::optional<std::int64_t> time_ms;      // set when finished
    std::uint64_t clicks{0};
    std::vector<std::string> path;
    std::vector<race::ScoreRow> standings;
};


template<transport::WebSocketConcept WS>
class Session {
public:
    using connection_handler   = std::function<void(transport::connection::Signal)>;
    using race_started_handler = std::function<void(const protocol::schema::RaceStarted&)>;
    using finish_handler       = std::function<void(const protocol::schema::PlayerFinish&)>;
    using error_handler        = std::function<void(std::string_view)>;
    using notification_handler = std::function<void(const notify::Notification&)>;
    using results_handler      = std::function<void(const Results&)>;

public:
    Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ~Session() {
        disconnect(false);
    }

    // -------------------------------------------------------------------------
    // Connection
    // -------------------------------------------------------------------------

    // Idempotent while connecting / connected
    [[nodiscard]]
    inline transport::Error connect(const std::string& url = std::string(config::DEFAULT_URL)) noexcept {
        return connection_.open(url);
    }

    // Optionally says goodbye to the room first. Always ends Disconnected.
    inline void disconnect(bool send_leave) noexcept {
        if (send_leave && connection_.is_connected()) {
            if (!send_(protocol::schema::LeaveRoom{})) {
                WR_WARN("[SESSION] leave_room could not be sent before disconnect.");
            }
        }
        connection_.close();
    }

    [[nodiscard]] inline bool is_connected() const noexcept { return connection_.is_connected(); }

    // -------------------------------------------------------------------------
    // Room actions
    // -------------------------------------------------------------------------

    inline bool join_room(std::string room_id, std::string player_name, std::string start_article, std::string end_article) {
        room_id_ = std::move(room_id);
        player_name_ = std::move(player_name);
        start_article_ = std::move(start_article);
        end_article_ = std::move(end_article);
        local_id_.clear();
        return send_(protocol::schema::JoinRoom{room_id_, player_name_, start_article_, end_article_});
    }

    // Arms a rejoin for this and every later connect (sent once per connect).
    // Returns true if the frame went out immediately.
    inline bool rejoin_room(std::string room_id, std::string player_name) {
        room_id_ = std::move(room_id);
        player_name_ = std::move(player_name);
        rejoin_armed_ = true;
        return maybe_send_rejoin_();
    }

    inline bool leave_room() {
        const bool sent = send_(protocol::schema::LeaveRoom{});
        rejoin_armed_ = false;
        reset_race_();
        store_.clear();
        local_id_.clear();
        return sent;
    }

    inline bool start_race() {
        return send_(protocol::schema::StartRace{});
    }

    // Host only, before the race starts
    inline bool update_room(std::string start_article, std::string end_article) {
        if (!is_host()) {
            WR_WARN("[SESSION] update_room ignored: local player is not the room host.");
            return false;
        }
        if (store_.started()) {
            WR_WARN("[SESSION] update_room ignored: race already started.");
            return false;
        }
        return send_(protocol::schema::UpdateRoom{std::move(start_article), std::move(end_article)});
    }

    [[nodiscard]]
    inline bool is_host() const noexcept {
        return !local_id_.empty() && store_.has_room() && store_.host_id() == local_id_;
    }

    // -------------------------------------------------------------------------
    // Race events fed by the presentation layer
    // -------------------------------------------------------------------------

    // The local article content finished loading; starts the clock once
    inline void on_article_loaded(TimePoint now) {
        if (current_article_.empty()) {
            set_current_article_(start_article());
        }
        timer_.start(now);
    }

    // Local navigation to `article`. Returns whether the navigate frame was sent.
    inline bool navigate(const std::string& article, TimePoint now) {
        if (timer_.local_state() == race::LocalState::Finished || timer_.forced_to_results()) {
            WR_DEBUG("[SESSION] navigate('" << article << "') after the race ended for the local player -> ignored");
            return false;
        }
        ++local_clicks_;
        local_path_.push_back(article);
        splits_.add(article, timer_.elapsed_ms(now));
        set_current_article_(article);

        const bool sent = send_(protocol::schema::Navigate{article});

        now_ = now;
        reevaluate_meetings_();

        auto elapsed = timer_.on_local_article(article, end_article(), now);
        if (elapsed.has()) {
            local_finished_at_ = now;
            if (!send_(protocol::schema::Finish{elapsed.value()})) {
                WR_WARN("[SESSION] finish could not be sent (" << elapsed.value() << " ms).");
            }
        }
        return sent;
    }

    // Pointer moved over the article. px/py are relative to the article container.
    inline bool pointer_move(const cursor::Layout& layout, double px, double py, const cursor::Element* under, TimePoint now) {
        if (!connection_.is_connected() || current_article_.empty()) {
            return false;
        }
        if (!throttle_.on_pointer(now, px, py)) {
            return false;
        }
        protocol::schema::Cursor msg = make_cursor_(layout, px, py);
        if (under) {
            msg.cursor_type = cursor::infer_affordance(*under);
        }
        return send_(msg);
    }

    // Scroll moved the content under a stationary pointer
    inline bool scroll_tick(const cursor::Layout& layout, double px, double py, TimePoint now) {
        if (!connection_.is_connected() || current_article_.empty()) {
            return false;
        }
        if (!throttle_.on_scroll(now, px, py)) {
            return false;
        }
        return send_(make_cursor_(layout, px, py));
    }

    // One animation frame for remote cursors
    inline void animate(const cursor::Layout& layout) {
        cursors_.tick(layout);
    }

    [[nodiscard]]
    inline std::vector<cursor::RenderInstruction> render_cursors() const {
        return cursors_.render();
    }

    // -------------------------------------------------------------------------
    // Event loop step
    // -------------------------------------------------------------------------
    inline void poll(TimePoint now) {
        now_ = now;
        connection_.poll();

        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_signal_(sig);
        }

        std::string frame;
        while (connection_.poll_message(frame)) {
            const auto r = router_.parse_and_route(frame);
            switch (r) {
                case protocol::parser::Result::InvalidJson:
                case protocol::parser::Result::InvalidSchema:
                case protocol::parser::Result::InvalidValue:
                    WR_WARN("[SESSION] Dropped malformed frame (" << to_string(r) << ")");
                    break;
                default:
                    break;
            }
        }

        if (timer_.poll(now)) {
            show_results_(false);
        }
        if (local_finished_at_.has() && !results_shown_ &&
            now >= local_finished_at_.value() + config::race::FINISH_NOTIFICATION_DELAY) {
            show_results_(true);
        }
        notifier_.poll(now);
    }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------
    inline void on_connection(connection_handler cb)     { on_connection_ = std::move(cb); }
    inline void on_race_started(race_started_handler cb) { on_race_started_ = std::move(cb); }
    inline void on_player_finish(finish_handler cb)      { on_player_finish_ = std::move(cb); }
    inline void on_error(error_handler cb)               { on_error_ = std::move(cb); }
    inline void on_notification(notification_handler cb) { on_notification_ = std::move(cb); }
    inline void on_results(results_handler cb)           { on_results_ = std::move(cb); }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline const room::Store& store() const noexcept { return store_; }
    [[nodiscard]] inline const race::Timer& timer() const noexcept { return timer_; }
    [[nodiscard]] inline const race::SplitTracker& splits() const noexcept { return splits_; }
    [[nodiscard]] inline const notify::MeetingNotifier& notifier() const noexcept { return notifier_; }
    [[nodiscard]] inline const cursor::RemotePool& cursors() const noexcept { return cursors_; }
    [[nodiscard]] inline const transport::Connection<WS>& connection() const noexcept { return connection_; }

    [[nodiscard]] inline const std::string& local_id() const noexcept { return local_id_; }
    [[nodiscard]] inline const std::string& player_name() const noexcept { return player_name_; }
    [[nodiscard]] inline const std::string& room_id() const noexcept { return room_id_; }
    [[nodiscard]] inline const std::string& current_article() const noexcept { return current_article_; }
    [[nodiscard]] inline std::uint64_t local_clicks() const noexcept { return local_clicks_; }
    [[nodiscard]] inline const std::vector<std::string>& local_path() const noexcept { return local_path_; }
    [[nodiscard]] inline bool results_shown() const noexcept { return results_shown_; }

    [[nodiscard]]
    inline const std::string& start_article() const noexcept {
        return (store_.has_room() && !store_.room().start_article.empty()) ? store_.room().start_article : start_article_;
    }

    [[nodiscard]]
    inline const std::string& end_article() const noexcept {
        return (store_.has_room() && !store_.room().end_article.empty()) ? store_.room().end_article : end_article_;
    }

    [[nodiscard]]
    inline std::vector<race::ScoreRow> scoreboard() const {
        return race::build_scoreboard(store_.room(), local_clicks_);
    }

#ifdef WR_UNIT_TEST
public:
    transport::Connection<WS>& connection() noexcept {
        return connection_;
    }
#endif // WR_UNIT_TEST

private:
    // Typed inbound messages are forwarded here by the router
    struct Inbound {
        Session& s;
        void on_room_state(const protocol::schema::RoomState& m)       { s.handle_(m); }
        void on_player_joined(const protocol::schema::Player& m)       { s.handle_(m); }
        void on_player_left(const protocol::schema::PlayerLeft& m)     { s.handle_(m); }
        void on_race_started(const protocol::schema::RaceStarted& m)   { s.handle_(m); }
        void on_player_update(const protocol::schema::PlayerUpdate& m) { s.handle_(m); }
        void on_player_finish(const protocol::schema::PlayerFinish& m) { s.handle_(m); }
        void on_cursor_update(const protocol::schema::CursorUpdate& m) { s.handle_(m); }
        void on_error_notice(const protocol::schema::ErrorNotice& m)   { s.handle_(m); }
    };

    transport::Connection<WS> connection_;
    Inbound inbound_{*this};
    protocol::parser::Router<Inbound> router_{inbound_};

    room::Store store_;
    race::Timer timer_;
    race::SplitTracker splits_;
    notify::MeetingNotifier notifier_;
    cursor::SendThrottle throttle_;
    cursor::RemotePool cursors_;

    // Identity
    std::string room_id_;
    std::string player_name_;
    std::string local_id_;
    std::string start_article_;
    std::string end_article_;

    // Rejoin bookkeeping: at most one rejoin_room per connection epoch
    bool rejoin_armed_{false};
    std::uint64_t rejoin_epoch_{0};

    // Local race progress
    std::string current_article_;
    std::uint64_t local_clicks_{0};
    std::vector<std::string> local_path_;
    lcr::optional<TimePoint> local_finished_at_;
    bool results_shown_{false};

    // Players whose finish was already announced this race
    std::unordered_set<std::string> finishers_;

    TimePoint now_{};

    connection_handler   on_connection_;
    race_started_handler on_race_started_;
    finish_handler       on_player_finish_;
    error_handler        on_error_;
    notification_handler on_notification_;
    results_handler      on_results_;

private:
    template<protocol::JsonWritable T>
    inline bool send_(const T& msg) {
        if (!connection_.is_connected()) {
            WR_WARN("[SESSION] Not connected, '" << protocol::to_string(T::type) << "' not sent.");
            return false;
        }
        return connection_.send(protocol::make_frame(msg));
    }

    inline bool maybe_send_rejoin_() {
        if (!rejoin_armed_ || !connection_.is_connected()) {
            return false;
        }
        if (rejoin_epoch_ == connection_.epoch()) {
            return false;   // already sent on this connection
        }
        if (!send_(protocol::schema::RejoinRoom{room_id_, player_name_})) {
            return false;
        }
        rejoin_epoch_ = connection_.epoch();
        WR_INFO("[SESSION] Rejoining room " << room_id_ << " as " << player_name_);
        return true;
    }

    inline void handle_signal_(transport::connection::Signal sig) {
        switch (sig) {
            case transport::connection::Signal::Connected:
                maybe_send_rejoin_();
                break;
            case transport::connection::Signal::Disconnected:
                WR_INFO("[SESSION] Connection lost (" << transport::to_string(connection_.disconnect_reason()) << ")");
                break;
            default:
                break;
        }
        if (on_connection_) {
            on_connection_(sig);
        }
    }

    inline protocol::schema::Cursor make_cursor_(const cursor::Layout& layout, double px, double py) const {
        const cursor::Locator loc = cursor::encode(layout, px, py);
        protocol::schema::Cursor msg;
        msg.x = loc.x;
        msg.y = loc.y;
        msg.article = current_article_;
        msg.anchor_id = loc.anchor_id;
        msg.next_anchor_id = loc.next_anchor_id;
        msg.section_ratio = loc.section_ratio;
        return msg;
    }

    inline void set_current_article_(const std::string& article) {
        current_article_ = article;
        cursors_.set_local_article(article);
    }

    // Before the id is known the display name is the only identity we have
    inline bool is_local_(const std::string& player_id, const std::string& name) const noexcept {
        if (!local_id_.empty()) {
            return player_id == local_id_;
        }
        return !player_name_.empty() && name == player_name_;
    }

    inline void resolve_local_id_() {
        if (!local_id_.empty() || player_name_.empty()) {
            return;
        }
        if (const auto* p = store_.find_by_name(player_name_)) {
            local_id_ = p->id;
            WR_DEBUG("[SESSION] Local player id resolved: " << local_id_);
        }
    }

    inline void reevaluate_meetings_() {
        if (!store_.has_room()) {
            return;
        }
        auto raised = notifier_.on_room_changed(store_.room(), local_id_, current_article_, now_);
        if (on_notification_) {
            for (const auto& n : raised) {
                on_notification_(n);
            }
        }
    }

    inline void show_results_(bool finished) {
        if (results_shown_) {
            return;
        }
        results_shown_ = true;
        Results r;
        r.finished = finished;
        if (finished) {
            r.time_ms = timer_.finish_time();
        }
        r.clicks = local_clicks_;
        r.path = local_path_;
        r.standings = scoreboard();
        WR_INFO("[SESSION] Results: " << (finished ? "finished" : "did not finish")
                << ", clicks=" << r.clicks);
        if (on_results_) {
            on_results_(r);
        }
    }

    inline void reset_race_() {
        timer_.reset();
        splits_.clear();
        notifier_.reset();
        throttle_.reset();
        cursors_.clear();
        current_article_.clear();
        local_clicks_ = 0;
        local_path_.clear();
        local_finished_at_.reset();
        results_shown_ = false;
        finishers_.clear();
    }

    // ---- inbound handlers ---------------------------------------------------

    inline void handle_(const protocol::schema::RoomState& m) {
        store_.apply(m);
        resolve_local_id_();
        cursors_.retain(store_.room().players);
        reevaluate_meetings_();
    }

    inline void handle_(const protocol::schema::Player& m) {
        store_.apply(m);
        resolve_local_id_();
        reevaluate_meetings_();
    }

    inline void handle_(const protocol::schema::PlayerLeft& m) {
        store_.apply(m);
        cursors_.remove(m.player_id);
        reevaluate_meetings_();
    }

    inline void handle_(const protocol::schema::RaceStarted& m) {
        store_.apply(m);
        if (on_race_started_) {
            on_race_started_(m);
        }
    }

    inline void handle_(const protocol::schema::PlayerUpdate& m) {
        store_.apply(m);
        reevaluate_meetings_();
    }

    inline void handle_(const protocol::schema::PlayerFinish& m) {
        store_.apply(m);
        timer_.on_finish_observed(now_);
        if (!finishers_.insert(m.player_id).second) {
            WR_DEBUG("[SESSION] Duplicate player_finish for " << m.player_id << " -> ignored");
            return;
        }
        if (!is_local_(m.player_id, m.player_name)) {
            const auto& n = notifier_.on_player_finished(m.player_id, m.player_name, now_);
            if (on_notification_) {
                on_notification_(n);
            }
        }
        if (on_player_finish_) {
            on_player_finish_(m);
        }
    }

    inline void handle_(const protocol::schema::CursorUpdate& m) {
        if (is_local_(m.player_id, m.player_name)) {
            return;
        }
        cursors_.update(m);
    }

    inline void handle_(const protocol::schema::ErrorNotice& m) {
        store_.apply(m);
        if (on_error_) {
            on_error_(m.error);
        }
    }
};

} // namespace wikirace::core
