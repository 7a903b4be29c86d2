#include "backend/MpdClient.hpp"
#include "util/Logger.hpp"
#include <mpd/client.h>
#include <algorithm>
#include <charconv>
#include <cstring>
#include <initializer_list>

namespace coda::backend {

namespace {

// MPD's own default chunk size for albumart responses
constexpr uint32_t DEFAULT_BINARY_CHUNK = 8192;

mpd_tag_type to_mpd_tag(Tag tag) {
    switch (tag) {
        case Tag::Artist:      return MPD_TAG_ARTIST;
        case Tag::AlbumArtist: return MPD_TAG_ALBUM_ARTIST;
        case Tag::Album:       return MPD_TAG_ALBUM;
        case Tag::Title:       return MPD_TAG_TITLE;
        case Tag::Track:       return MPD_TAG_TRACK;
        case Tag::Disc:        return MPD_TAG_DISC;
    }
    return MPD_TAG_UNKNOWN;
}

[[noreturn]] void throw_connection_error(mpd_connection* conn, const std::string& what) {
    auto err = mpd_connection_get_error(conn);
    const char* detail = mpd_connection_get_error_message(conn);
    std::string message = what + ": " + (detail ? detail : "unknown error");

    DaemonError::Kind kind = DaemonError::Kind::Connection;
    switch (err) {
        case MPD_ERROR_TIMEOUT:   kind = DaemonError::Kind::Timeout; break;
        case MPD_ERROR_SERVER:    kind = DaemonError::Kind::Server; break;
        case MPD_ERROR_MALFORMED:
        case MPD_ERROR_STATE:
        case MPD_ERROR_ARGUMENT:  kind = DaemonError::Kind::Protocol; break;
        default: break;
    }
    throw DaemonError(kind, message);
}

void check(mpd_connection* conn, bool ok, const std::string& what) {
    if (!ok || mpd_connection_get_error(conn) != MPD_ERROR_SUCCESS) {
        throw_connection_error(conn, what);
    }
}

void finish_response(mpd_connection* conn, const std::string& what) {
    check(conn, mpd_response_finish(conn), what);
}

// "3/12" → 3; anything unparsable → 0
int leading_number(const char* value) {
    if (!value) return 0;
    int n = 0;
    std::from_chars(value, value + std::strlen(value), n);
    return n;
}

model::Track track_from_song(const mpd_song* song) {
    model::Track t;

    if (const char* v = mpd_song_get_tag(song, MPD_TAG_TITLE, 0)) t.title = v;
    if (const char* v = mpd_song_get_tag(song, MPD_TAG_ARTIST, 0)) t.artist = v;
    if (const char* v = mpd_song_get_tag(song, MPD_TAG_ALBUM, 0)) t.album = v;

    const char* album_artist = mpd_song_get_tag(song, MPD_TAG_ALBUM_ARTIST, 0);
    if (album_artist && *album_artist) {
        t.album_artist = album_artist;
        t.has_explicit_album_artist = true;
    } else {
        t.album_artist = t.artist;
    }

    t.file = mpd_song_get_uri(song);
    t.disc = leading_number(mpd_song_get_tag(song, MPD_TAG_DISC, 0));
    t.track = leading_number(mpd_song_get_tag(song, MPD_TAG_TRACK, 0));

    unsigned duration = mpd_song_get_duration_ms(song);
    if (duration > 0) {
        t.duration_ms = duration;
    }

    if (const mpd_audio_format* af = mpd_song_get_audio_format(song)) {
        if (af->sample_rate > 0) {
            t.format = std::to_string(af->sample_rate) + ":" + std::to_string(af->bits) + ":" +
                       std::to_string(af->channels);
        }
    }

    return t;
}

}  // namespace

const char* to_string(Tag tag) {
    switch (tag) {
        case Tag::Artist:      return "Artist";
        case Tag::AlbumArtist: return "AlbumArtist";
        case Tag::Album:       return "Album";
        case Tag::Title:       return "Title";
        case Tag::Track:       return "Track";
        case Tag::Disc:        return "Disc";
    }
    return "Unknown";
}

// ─── Connection pool ────────────────────────────────────────────────────────

void MpdClient::ConnectionDeleter::operator()(mpd_connection* conn) const {
    if (conn) mpd_connection_free(conn);
}

namespace {

// ACK errors leave the connection usable once cleared; I/O errors do not
bool connection_reusable(mpd_connection* conn) {
    if (mpd_connection_get_error(conn) == MPD_ERROR_SUCCESS || mpd_connection_clear_error(conn)) {
        return true;
    }
    util::Logger::debug("MpdClient: Dropping broken connection");
    return false;
}

}  // namespace

MpdClient::MpdClient(Settings settings)
    : settings_(std::move(settings)),
      interactive_(settings_.pool_size, [this]() { return open_connection(); }, connection_reusable),
      art_(settings_.art_pool_size, [this]() { return open_connection(); }, connection_reusable) {}

MpdClient::~MpdClient() = default;

void MpdClient::connect() {
    // Borrow and return one connection; errors propagate to the caller
    auto lease = interactive_.acquire();
    if (const unsigned* version = mpd_connection_get_server_version(lease.get())) {
        util::Logger::info("MpdClient: Connected to MPD " + std::to_string(version[0]) + "." +
                           std::to_string(version[1]) + "." + std::to_string(version[2]));
    }
}

std::unique_ptr<mpd_connection, MpdClient::ConnectionDeleter> MpdClient::open_connection() {
    const char* host = settings_.host.empty() ? nullptr : settings_.host.c_str();
    std::unique_ptr<mpd_connection, ConnectionDeleter> conn(
        mpd_connection_new(host, settings_.port, settings_.timeout_ms));
    if (!conn) {
        throw DaemonError(DaemonError::Kind::Connection, "connect: out of memory");
    }
    if (mpd_connection_get_error(conn.get()) != MPD_ERROR_SUCCESS) {
        throw_connection_error(conn.get(), "connect to " +
                               (settings_.host.empty() ? std::string("(default)") : settings_.host));
    }

    uint32_t limit = binary_limit_.load();
    if (limit > 0 && binary_limit_supported_.load()) {
        apply_binary_limit(conn.get(), limit);
    }

    util::Logger::debug("MpdClient: Opened connection");
    return conn;
}

void MpdClient::apply_binary_limit(mpd_connection* conn, uint32_t bytes) {
    if (mpd_run_binarylimit(conn, bytes)) {
        return;
    }
    // Daemons without the command answer with an ACK; the connection stays
    // usable and transfers use the default chunk size
    if (mpd_connection_get_error(conn) == MPD_ERROR_SERVER) {
        const char* detail = mpd_connection_get_error_message(conn);
        util::Logger::warn(std::string("MpdClient: binarylimit rejected (") + (detail ? detail : "unknown") +
                           "), using the default chunk size");
        if (mpd_connection_clear_error(conn)) {
            binary_limit_supported_.store(false);
            return;
        }
    }
    throw_connection_error(conn, "binarylimit");
}

template<typename Fn>
void MpdClient::run_command(const char* what, Fn&& fn) {
    auto lease = interactive_.acquire();
    check(lease.get(), fn(lease.get()), what);
}

// ─── Queries ────────────────────────────────────────────────────────────────

std::optional<Artwork> MpdClient::fetch_album_art(const std::string& file) {
    auto lease = art_.acquire();
    mpd_connection* conn = lease.get();

    // The receive buffer must hold a whole chunk or the stream desyncs
    std::vector<uint8_t> chunk(std::max(binary_limit_.load(), DEFAULT_BINARY_CHUNK));
    Artwork data;
    unsigned offset = 0;

    while (true) {
        int received = mpd_run_albumart(conn, file.c_str(), offset, chunk.data(), chunk.size());
        if (received < 0) {
            if (mpd_connection_get_error(conn) == MPD_ERROR_SERVER &&
                mpd_connection_get_server_error(conn) == MPD_SERVER_ERROR_NO_EXIST) {
                return std::nullopt;
            }
            throw_connection_error(conn, "albumart " + file);
        }
        if (received == 0) {
            break;
        }
        data.insert(data.end(), chunk.begin(), chunk.begin() + received);
        offset += static_cast<unsigned>(received);
    }

    if (data.empty()) {
        return std::nullopt;
    }
    return data;
}

std::vector<std::string> MpdClient::list_tag_values(Tag tag) {
    auto lease = interactive_.acquire();
    mpd_connection* conn = lease.get();
    const mpd_tag_type mpd_tag = to_mpd_tag(tag);
    const std::string what = std::string("list ") + to_string(tag);

    check(conn, mpd_search_db_tags(conn, mpd_tag) && mpd_search_commit(conn), what);

    std::vector<std::string> values;
    while (mpd_pair* pair = mpd_recv_pair_tag(conn, mpd_tag)) {
        values.emplace_back(pair->value);
        mpd_return_pair(conn, pair);
    }
    finish_response(conn, what);
    return values;
}

std::vector<model::Track> MpdClient::find_songs(Tag tag, const std::string& value,
                                                std::optional<Tag> sort) {
    auto lease = interactive_.acquire();
    mpd_connection* conn = lease.get();
    const std::string what = std::string("find ") + to_string(tag) + " \"" + value + "\"";

    bool ok = mpd_search_db_songs(conn, true) &&
              mpd_search_add_tag_constraint(conn, MPD_OPERATOR_DEFAULT, to_mpd_tag(tag), value.c_str());
    if (ok && sort) {
        ok = mpd_search_add_sort_tag(conn, to_mpd_tag(*sort), false);
    }
    if (!ok) {
        mpd_search_cancel(conn);
        throw_connection_error(conn, what);
    }
    check(conn, mpd_search_commit(conn), what);

    std::vector<model::Track> tracks;
    while (mpd_song* song = mpd_recv_song(conn)) {
        tracks.push_back(track_from_song(song));
        mpd_song_free(song);
    }
    finish_response(conn, what);
    return tracks;
}

std::vector<model::Track> MpdClient::list_all_songs() {
    auto lease = interactive_.acquire();
    mpd_connection* conn = lease.get();

    check(conn, mpd_send_list_all_meta(conn, nullptr), "listallinfo");

    std::vector<model::Track> tracks;
    while (mpd_entity* entity = mpd_recv_entity(conn)) {
        if (mpd_entity_get_type(entity) == MPD_ENTITY_TYPE_SONG) {
            tracks.push_back(track_from_song(mpd_entity_get_song(entity)));
        }
        mpd_entity_free(entity);
    }
    finish_response(conn, "listallinfo");

    util::Logger::debug("MpdClient: listallinfo returned " + std::to_string(tracks.size()) + " songs");
    return tracks;
}

model::Status MpdClient::status() {
    auto lease = interactive_.acquire();
    mpd_connection* conn = lease.get();

    mpd_status* st = mpd_run_status(conn);
    if (!st) {
        throw_connection_error(conn, "status");
    }

    model::Status result;
    switch (mpd_status_get_state(st)) {
        case MPD_STATE_PLAY:  result.state = model::PlayState::Playing; break;
        case MPD_STATE_PAUSE: result.state = model::PlayState::Paused; break;
        default:              result.state = model::PlayState::Stopped; break;
    }
    result.volume = mpd_status_get_volume(st);
    result.repeat = mpd_status_get_repeat(st);
    result.random = mpd_status_get_random(st);
    result.single = mpd_status_get_single(st);
    result.consume = mpd_status_get_consume(st);
    result.queue_length = mpd_status_get_queue_length(st);

    int pos = mpd_status_get_song_pos(st);
    if (pos >= 0) {
        result.song_pos = static_cast<size_t>(pos);
    }
    if (result.state != model::PlayState::Stopped) {
        result.elapsed_ms = mpd_status_get_elapsed_ms(st);
        unsigned total = mpd_status_get_total_time(st);
        if (total > 0) result.duration_ms = total * 1000;
    }
    if (const mpd_audio_format* af = mpd_status_get_audio_format(st)) {
        if (af->sample_rate > 0) result.sample_rate = af->sample_rate;
    }

    mpd_status_free(st);
    return result;
}

void MpdClient::set_binary_limit(uint32_t bytes) {
    binary_limit_.store(bytes);
    binary_limit_supported_.store(true);

    // New connections pick the limit up in open_connection(); apply it to
    // the idle ones now
    for (Pool* pool : {&interactive_, &art_}) {
        for (const auto& lease : pool->lease_idle()) {
            if (!binary_limit_supported_.load()) break;
            apply_binary_limit(lease.get(), bytes);
        }
    }
    if (binary_limit_supported_.load()) {
        util::Logger::info("MpdClient: Binary limit set to " + std::to_string(bytes) + " bytes");
    }
}

std::optional<model::Track> MpdClient::current_song() {
    auto lease = interactive_.acquire();
    mpd_connection* conn = lease.get();

    mpd_song* song = mpd_run_current_song(conn);
    if (!song) {
        check(conn, true, "currentsong");
        return std::nullopt;
    }
    model::Track t = track_from_song(song);
    t.queue_pos = mpd_song_get_pos(song);
    mpd_song_free(song);
    return t;
}

std::vector<model::Track> MpdClient::queue() {
    auto lease = interactive_.acquire();
    mpd_connection* conn = lease.get();

    check(conn, mpd_send_list_queue_meta(conn), "playlistinfo");

    std::vector<model::Track> tracks;
    while (mpd_song* song = mpd_recv_song(conn)) {
        model::Track t = track_from_song(song);
        t.queue_pos = mpd_song_get_pos(song);
        tracks.push_back(std::move(t));
        mpd_song_free(song);
    }
    finish_response(conn, "playlistinfo");
    return tracks;
}

// ─── Commands ───────────────────────────────────────────────────────────────

void MpdClient::toggle_pause(model::PlayState current) {
    if (current == model::PlayState::Stopped) {
        run_command("play", [](mpd_connection* c) { return mpd_run_play(c); });
    } else {
        run_command("pause", [](mpd_connection* c) { return mpd_run_toggle_pause(c); });
    }
}

void MpdClient::next() {
    run_command("next", [](mpd_connection* c) { return mpd_run_next(c); });
}

void MpdClient::previous() {
    run_command("previous", [](mpd_connection* c) { return mpd_run_previous(c); });
}

void MpdClient::set_volume(int percent) {
    unsigned volume = static_cast<unsigned>(std::clamp(percent, 0, 100));
    run_command("setvol", [volume](mpd_connection* c) { return mpd_run_set_volume(c, volume); });
}

void MpdClient::seek_current(int delta_seconds) {
    run_command("seekcur", [delta_seconds](mpd_connection* c) {
        return mpd_run_seek_current(c, static_cast<float>(delta_seconds), true);
    });
}

void MpdClient::set_repeat(bool on) {
    run_command("repeat", [on](mpd_connection* c) { return mpd_run_repeat(c, on); });
}

void MpdClient::set_random(bool on) {
    run_command("random", [on](mpd_connection* c) { return mpd_run_random(c, on); });
}

void MpdClient::set_single(bool on) {
    run_command("single", [on](mpd_connection* c) { return mpd_run_single(c, on); });
}

void MpdClient::set_consume(bool on) {
    run_command("consume", [on](mpd_connection* c) { return mpd_run_consume(c, on); });
}

void MpdClient::clear_queue() {
    run_command("clear", [](mpd_connection* c) { return mpd_run_clear(c); });
}

void MpdClient::delete_queue_pos(size_t pos) {
    run_command("delete", [pos](mpd_connection* c) {
        return mpd_run_delete(c, static_cast<unsigned>(pos));
    });
}

void MpdClient::move_queue_pos(size_t from, size_t to) {
    run_command("move", [from, to](mpd_connection* c) {
        return mpd_run_move(c, static_cast<unsigned>(from), static_cast<unsigned>(to));
    });
}

void MpdClient::play_queue_pos(size_t pos) {
    run_command("play", [pos](mpd_connection* c) {
        return mpd_run_play_pos(c, static_cast<unsigned>(pos));
    });
}

void MpdClient::add_to_queue(const std::string& file) {
    run_command("add", [&file](mpd_connection* c) { return mpd_run_add(c, file.c_str()); });
}

}  // namespace coda::backend
