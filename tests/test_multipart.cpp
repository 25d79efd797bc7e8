// Multipart storage upload: fresh uploads, resume and failure handling.
#include "test_support.h"
#include "multipart_uploader.h"
#include "session_store.h"

#include <cstdio>

using namespace mfs;

struct Recorder : ProgressSink {
    std::vector<ProgressEvent> events;
    void on_progress(const ProgressEvent& ev) override { events.push_back(ev); }
};

static const uint64_t kSize = 2621440;   // 2.5 MiB, three parts

static int test_fresh() {
    mfstest::FakeTransport http;
    mfstest::StorageBackend store;
    store.install(http);
    UploaderApi api(http, mfstest::kApiBase);
    mfstest::MemKV kv;
    SessionStore sessions(kv);
    Recorder rec;
    MultipartUploader up(api, sessions, &rec);

    const std::string data = mfstest::pattern_bytes(kSize);
    MemoryFileSource src(data);
    FileDescriptor f{"clip.mp4", kSize, "video/mp4"};
    std::string storage_key;
    Error e;
    TEST_CHECK(up.upload(f, src, "m1", mfstest::kAddress, storage_key, e), "upload");
    TEST_CHECK(store.initiated == 1 && store.completed == 1, "initiated and completed once");
    TEST_CHECK(store.uploaded_order == std::vector<int>({1, 2, 3}), "parts in order");
    TEST_CHECK(store.parts[1].size() == 1048576 && store.parts[3].size() == 524288, "1 MiB parts, short tail");
    TEST_CHECK(store.assembled() == data, "bytes intact");
    TEST_CHECK(store.completed_parts == std::vector<int>({1, 2, 3}), "complete lists all parts ascending");
    TEST_CHECK(storage_key == "k1", "falls back to the initiate key");
    TEST_CHECK(up.uploaded_parts() == 3 && up.reused_parts() == 0, "counters");
    TEST_CHECK(kv.map.empty(), "session cleared after completion");

    TEST_CHECK(rec.events.size() == 5, "start, three parts, completing");
    TEST_CHECK(rec.events[0].current_part == 0 && rec.events[0].total_parts == 3, "start event");
    TEST_CHECK(rec.events[3].uploaded_bytes == kSize && rec.events[3].percent == 100.0, "last part event");
    TEST_CHECK(rec.events[4].phase == ProgressPhase::Completing, "completing event");
    TEST_PASS("fresh upload");
    return 0;
}

static int test_resume() {
    mfstest::FakeTransport http;
    mfstest::StorageBackend store;
    store.install(http);
    store.complete_key = "files/final";
    UploaderApi api(http, mfstest::kApiBase);
    mfstest::MemKV kv;
    SessionStore sessions(kv);
    MultipartUploader up(api, sessions);

    const std::string data = mfstest::pattern_bytes(kSize);
    MemoryFileSource src(data);
    FileDescriptor f{"clip.mp4", kSize, ""};

    // a previous attempt committed part 1 and then stopped
    UploadSession s;
    s.upload_id = "u1";
    s.key = "k1";
    s.file_name = f.name;
    s.file_size = kSize;
    Error e;
    const std::string skey = session_key(f.name, kSize, "m1", mfstest::kAddress);
    TEST_CHECK(sessions.save(skey, s, e), "seed session");
    store.parts[1] = data.substr(0, 1048576);

    std::string storage_key;
    TEST_CHECK(up.upload(f, src, "m1", mfstest::kAddress, storage_key, e), "resumed upload");
    TEST_CHECK(store.initiated == 0, "no new multipart upload");
    TEST_CHECK(store.uploaded_order == std::vector<int>({2, 3}), "only the missing parts sent");
    TEST_CHECK(up.reused_parts() == 1 && up.uploaded_parts() == 2, "counters");
    TEST_CHECK(store.assembled() == data, "bytes intact");
    TEST_CHECK(storage_key == "files/final", "complete key preferred");
    TEST_CHECK(kv.map.empty(), "session cleared");
    TEST_PASS("resume");
    return 0;
}

static int test_stale_session() {
    mfstest::FakeTransport http;
    mfstest::StorageBackend store;
    store.install(http);
    store.upload_id = "u2";
    UploaderApi api(http, mfstest::kApiBase);
    mfstest::MemKV kv;
    SessionStore sessions(kv);
    MultipartUploader up(api, sessions);

    MemoryFileSource src(mfstest::pattern_bytes(1000));
    FileDescriptor f{"a.txt", 1000, "text/plain"};
    UploadSession s;
    s.upload_id = "gone";
    s.key = "old";
    Error e;
    TEST_CHECK(sessions.save(session_key(f.name, 1000, "m1", mfstest::kAddress), s, e), "seed stale session");

    std::string storage_key;
    TEST_CHECK(up.upload(f, src, "m1", mfstest::kAddress, storage_key, e), "upload after stale session");
    TEST_CHECK(store.initiated == 1, "started over");
    TEST_CHECK(http.count("POST", EP_MP_LIST_PARTS) == 1, "listed once");
    TEST_CHECK(storage_key == "k1", "new key");
    TEST_PASS("stale session");
    return 0;
}

static int test_failures() {
    mfstest::FakeTransport http;
    mfstest::StorageBackend store;
    store.install(http);
    store.fail_part = 2;
    UploaderApi api(http, mfstest::kApiBase);
    mfstest::MemKV kv;
    SessionStore sessions(kv);
    MultipartUploader up(api, sessions);

    const std::string data = mfstest::pattern_bytes(kSize);
    MemoryFileSource src(data);
    FileDescriptor f{"clip.mp4", kSize, ""};
    std::string storage_key;
    Error e;
    TEST_CHECK(!up.upload(f, src, "m1", mfstest::kAddress, storage_key, e), "part failure");
    TEST_CHECK(e.kind == ErrKind::RemoteRequestFailure, "remote failure");
    TEST_CHECK(e.message == "Failed to upload file: Failed to upload part 2: HTTP Error: 500 (storage unavailable)",
               "message names the part");
    TEST_CHECK(kv.map.size() == 1, "session kept for resume");

    // retry resumes from part 2
    store.fail_part = 0;
    store.uploaded_order.clear();
    TEST_CHECK(up.upload(f, src, "m1", mfstest::kAddress, storage_key, e), "retry");
    TEST_CHECK(store.uploaded_order == std::vector<int>({2, 3}), "retry sends the rest");
    TEST_CHECK(store.initiated == 1, "still one multipart upload");

    MemoryFileSource empty("");
    FileDescriptor ef{"empty.bin", 0, ""};
    e.clear();
    TEST_CHECK(!up.upload(ef, empty, "m1", mfstest::kAddress, storage_key, e), "empty file refused");
    TEST_CHECK(e.kind == ErrKind::InvalidInput, "invalid input");

    FileDescriptor wrong{"clip.mp4", kSize + 1, ""};
    e.clear();
    TEST_CHECK(!up.upload(wrong, src, "m1", mfstest::kAddress, storage_key, e), "size mismatch refused");

    http.fail_transport = true;
    e.clear();
    TEST_CHECK(!up.upload(f, src, "m2", mfstest::kAddress, storage_key, e), "transport down");
    TEST_CHECK(e.message.find("Failed to upload file: Failed to initiate multipart upload") == 0, "initiate context");
    TEST_PASS("failures");
    return 0;
}

static int test_listed_part_range() {
    mfstest::FakeTransport http;
    http.on("POST", EP_MP_LIST_PARTS, [](const HttpRequest&, const JNode&, HttpResponse& r){
        JArr parts;
        const double numbers[] = {4294967297.0, 0, -3, 2};
        for (double n : numbers) {
            JObj p;
            p["partNumber"] = jnum(n);
            p["etag"] = jstr("e" + std::to_string((long long)n));
            p["size"] = jnum(1048576);
            parts.push_back(jobj(p));
        }
        JObj d;
        d["parts"] = jarr(parts);
        r.body = mfstest::ok_body(jobj(d));
    });
    UploaderApi api(http, mfstest::kApiBase);
    MultipartUpload mu;
    mu.upload_id = "u1";
    mu.key = "k1";
    std::vector<UploadPart> listed;
    Error e;
    TEST_CHECK(api.multipart_list_parts(mu, listed, e), "list parts");
    TEST_CHECK(listed.size() == 1, "out-of-range part numbers dropped");
    TEST_CHECK(listed[0].part_number == 2 && listed[0].etag == "e2", "valid part kept");
    TEST_PASS("listed part range");
    return 0;
}

int main() {
    log_init(LogLevel::ERR);
    if (test_fresh()) return 1;
    if (test_resume()) return 1;
    if (test_stale_session()) return 1;
    if (test_failures()) return 1;
    if (test_listed_part_range()) return 1;
    std::printf("All multipart tests passed!\n");
    return 0;
}
