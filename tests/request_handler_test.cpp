#include "request_handler.hpp"
#include "fake_filesystem.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

using namespace serveit;
using serveit::test::FakeFileSystem;
namespace fs = std::filesystem;

namespace {

const std::string kUpLink = "<li><a href=\"../\">../</a></li>";

class RequestHandlerFakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        fake_->add_dir("/root");
        fake_->add_file("/root/a.txt", "hi");
        fake_->add_file("/root/sub/b.txt", "bee");
        fake_->add_file("/root/locked.bin", "secret");
        fake_->add_dir("/root/private");
        fake_->deny("/root/locked.bin");
        fake_->deny("/root/private");
        handler_ = std::make_unique<RequestHandler>("/root", fake_);
    }

    std::shared_ptr<FakeFileSystem> fake_ = std::make_shared<FakeFileSystem>();
    std::unique_ptr<RequestHandler> handler_;
};

// Scratch directory on disk, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("serveit-test-" + std::to_string(stamp) + "-" + std::to_string(rd()));
        fs::create_directories(path_);
        path_ = fs::canonical(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

    void write(const fs::path& rel, const std::string& contents) const {
        fs::create_directories((path_ / rel).parent_path());
        std::ofstream out(path_ / rel, std::ios::binary);
        out << contents;
    }

private:
    fs::path path_;
};

} // namespace

TEST_F(RequestHandlerFakeTest, RootListingHasNoUpLink) {
    auto resp = handler_->handle("/");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.content_type, "text/html; charset=utf-8");
    EXPECT_EQ(resp.body.find(kUpLink), std::string::npos);
    EXPECT_NE(resp.body.find("<li><a href=\"a.txt\">a.txt</a></li>"), std::string::npos);
    EXPECT_NE(resp.body.find("<li><a href=\"sub/\">sub/</a></li>"), std::string::npos);
}

TEST_F(RequestHandlerFakeTest, EntriesAreSorted) {
    auto resp = handler_->handle("/");
    auto a = resp.body.find("a.txt");
    auto locked = resp.body.find("locked.bin");
    auto priv = resp.body.find("private/");
    auto sub = resp.body.find("sub/");
    ASSERT_NE(a, std::string::npos);
    EXPECT_LT(a, locked);
    EXPECT_LT(locked, priv);
    EXPECT_LT(priv, sub);
}

TEST_F(RequestHandlerFakeTest, NestedListingHasOneUpLink) {
    auto resp = handler_->handle("/sub/");
    EXPECT_EQ(resp.status, 200);
    auto first = resp.body.find(kUpLink);
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(resp.body.find(kUpLink, first + 1), std::string::npos);
    EXPECT_NE(resp.body.find("<li><a href=\"b.txt\">b.txt</a></li>"), std::string::npos);
}

TEST_F(RequestHandlerFakeTest, ServesFileBytes) {
    auto resp = handler_->handle("/a.txt");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.content_type, "text/plain");
    EXPECT_EQ(resp.body, "hi");
}

TEST_F(RequestHandlerFakeTest, MissingIs404WithoutDetails) {
    auto resp = handler_->handle("/missing");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body, "Not found");
    EXPECT_EQ(resp.body.find("/root"), std::string::npos);
}

TEST_F(RequestHandlerFakeTest, BadEncodingIs400) {
    auto resp = handler_->handle("/a%2");
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(resp.body, "Bad URL encoding");
}

TEST_F(RequestHandlerFakeTest, UnreadableFileIs403) {
    auto resp = handler_->handle("/locked.bin");
    EXPECT_EQ(resp.status, 403);
    EXPECT_EQ(resp.body, "Cannot read file");
}

TEST_F(RequestHandlerFakeTest, UnreadableDirectoryIs403) {
    auto resp = handler_->handle("/private/");
    EXPECT_EQ(resp.status, 403);
    EXPECT_EQ(resp.body, "Cannot read directory");
}

TEST_F(RequestHandlerFakeTest, TraversalIs404) {
    auto resp = handler_->handle("/../etc/passwd");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body, "Not found");
}

TEST_F(RequestHandlerFakeTest, ListingTwiceIsIdentical) {
    EXPECT_EQ(handler_->handle("/").body, handler_->handle("/").body);
}

TEST(RequestHandlerDisk, ServesTreeFromDisk) {
    TempDir dir;
    dir.write("a.txt", "hi");
    dir.write("sub/b.txt", "bee");

    RequestHandler handler(dir.path(), std::make_shared<LocalFileSystem>());

    auto root = handler.handle("/");
    EXPECT_EQ(root.status, 200);
    EXPECT_EQ(root.body,
              "<!doctype html><html><head><meta charset='utf-8'><title>Index</title>"
              "<style>body{font-family:system-ui,Arial,sans-serif} a{text-decoration:none}</style>"
              "</head><body><h1>Index</h1><ul>"
              "<li><a href=\"a.txt\">a.txt</a></li>"
              "<li><a href=\"sub/\">sub/</a></li>"
              "</ul></body></html>");

    auto file = handler.handle("/a.txt");
    EXPECT_EQ(file.status, 200);
    EXPECT_EQ(file.body, "hi");

    auto sub = handler.handle("/sub/");
    EXPECT_EQ(sub.status, 200);
    EXPECT_NE(sub.body.find(kUpLink), std::string::npos);
    EXPECT_NE(sub.body.find("<li><a href=\"b.txt\">b.txt</a></li>"), std::string::npos);

    EXPECT_EQ(handler.handle("/missing").status, 404);
}

TEST(RequestHandlerDisk, BinaryFileIsByteExact) {
    TempDir dir;
    std::string bytes;
    for (int i = 0; i < 256; ++i) bytes.push_back(static_cast<char>(i));
    bytes += std::string("\0\r\n\0", 4);
    dir.write("blob.unknownext", bytes);

    RequestHandler handler(dir.path(), std::make_shared<LocalFileSystem>());
    auto resp = handler.handle("/blob.unknownext");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.content_type, "application/octet-stream");
    EXPECT_EQ(resp.body, bytes);
}

TEST(RequestHandlerDisk, EncodedNamesRoundTrip) {
    TempDir dir;
    dir.write("My File #1.txt", "spaced");

    RequestHandler handler(dir.path(), std::make_shared<LocalFileSystem>());
    auto listing = handler.handle("/");
    EXPECT_NE(listing.body.find("href=\"My%20File%20%231.txt\""), std::string::npos);

    auto resp = handler.handle("/My%20File%20%231.txt");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "spaced");
}

TEST(RequestHandlerDisk, NonUtf8NameIsListedAndServed) {
    TempDir dir;
    dir.write("bad\xFFname", "raw");

    RequestHandler handler(dir.path(), std::make_shared<LocalFileSystem>());
    auto listing = handler.handle("/");
    EXPECT_EQ(listing.status, 200);
    EXPECT_NE(listing.body.find("<li><a href=\"bad%FFname\">bad\xEF\xBF\xBDname</a></li>"),
              std::string::npos);
    EXPECT_EQ(listing.body.find('\xFF'), std::string::npos);

    auto resp = handler.handle("/bad%FFname");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "raw");
}
