#include "record_streamer/checkpoint_store.hpp"
#include "record_streamer/fingerprint.hpp"
#include "../fixtures.hpp"

#include <string>

int main(){
  const auto dir = fx::temp_dir("checkpoint-store");
  const std::string doc = fx::onix_doc(5, "onix");
  const std::string src = fx::write_file(dir / "feed.xml", doc).string();
  const std::uint64_t pos = doc.find("</onix:Product>") + 15;

  rs::SessionState st;
  st.namespace_detected = true;
  st.namespace_prefix = "onix";
  st.header_processed = true;
  st.total_record_count = 1;
  st.processed_count = 1;
  st.phase = rs::Phase::Interrupted;

  rs::CheckpointStore store(src);
  fx::check(store.path() == src + ".checkpoint", "checkpoint sits beside the source");
  fx::check(store.load().status == rs::CheckpointStore::LoadStatus::Absent, "absent before first save");

  auto saved = store.save(pos, 1, st, 4096);
  fx::check(saved.has_value() && store.exists(), "save writes the file");
  fx::check(!fx::fs::exists(store.path() + ".tmp"), "no temporary file left behind");

  {
    auto r = store.load();
    fx::check(r.status == rs::CheckpointStore::LoadStatus::Valid && r.checkpoint, "saved checkpoint is valid");
    if (r.checkpoint) {
      const auto& cp = *r.checkpoint;
      fx::check(cp.byte_position == pos && cp.record_count == 1, "position and count kept");
      fx::check(cp.source_size == doc.size() && cp.chunk_size == 4096, "size and chunk kept");
      fx::check(cp.fingerprint == saved->fingerprint && cp.fingerprint.digest.size() == 64, "fingerprint kept");
      fx::check(cp.state.namespace_prefix.value_or("") == "onix" && cp.state.phase == rs::Phase::Interrupted &&
                cp.state.processed_count == 1, "session state kept");
    }
  }

  {
    std::string err;
    auto cp = rs::checkpoint_from_json("{\"version\":1,\"byte_position\":10}", &err);
    fx::check(!cp && err.find("record_count") != std::string::npos, "missing field rejected");
    auto bad = *saved;
    bad.byte_position = doc.size() + 1;
    fx::check(!rs::checkpoint_from_json(rs::to_json(bad)), "position beyond source rejected");
    bad = *saved;
    bad.version = 99;
    fx::check(!rs::checkpoint_from_json(rs::to_json(bad)), "unknown version rejected");
  }

  {
    // a checkpoint written an hour ago
    auto old = *saved;
    old.created_at -= 3600;
    fx::write_file(store.path(), rs::to_json(old));
    rs::CheckpointStore::Config cfg;
    cfg.max_age_s = 60;
    rs::CheckpointStore aged(src, cfg);
    fx::check(aged.load().status == rs::CheckpointStore::LoadStatus::Expired, "old checkpoint expires");
    fx::check(store.load().status == rs::CheckpointStore::LoadStatus::Valid, "no age limit by default");
  }

  {
    fx::write_file(store.path(), "{\"version\": 1, \"byte_pos");
    auto r = store.load();
    fx::check(r.status == rs::CheckpointStore::LoadStatus::Corrupt && !r.message.empty(), "truncated file is corrupt");
    fx::check(!store.peek(), "peek gives nothing for a corrupt file");
  }

  {
    store.save(pos, 1, st, 4096);
    fx::write_file(src, doc + "<!-- appended -->\n");
    fx::check(store.inspect().status == rs::CheckpointStore::LoadStatus::Stale && store.exists(),
              "inspect reports a stale checkpoint and leaves it in place");
    auto r = store.load();
    fx::check(r.status == rs::CheckpointStore::LoadStatus::Stale, "changed source makes checkpoint stale");
    fx::check(!store.exists(), "stale checkpoint removed");
  }

  {
    rs::CheckpointStore::Config cfg;
    cfg.path = (dir / "state" / "custom.ckpt").string();
    rs::CheckpointStore custom(src, cfg);
    fx::check(custom.save(0, 0, st, 1).has_value() && fx::fs::exists(cfg.path), "custom path with new directory");
    fx::check(custom.clear() && !custom.exists(), "clear removes the file");
    fx::check(custom.clear(), "clear without a file succeeds");
  }

  std::error_code ec;
  fx::fs::remove_all(dir, ec);
  return fx::result();
}
