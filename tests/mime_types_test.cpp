#include "mime_types.hpp"
#include <gtest/gtest.h>

using serveit::mime_type_for;

TEST(MimeTypes, KnownExtensions) {
    EXPECT_EQ(mime_type_for("a.txt"), "text/plain");
    EXPECT_EQ(mime_type_for("index.html"), "text/html");
    EXPECT_EQ(mime_type_for("style.css"), "text/css");
    EXPECT_EQ(mime_type_for("photo.jpeg"), "image/jpeg");
    EXPECT_EQ(mime_type_for("doc.pdf"), "application/pdf");
}

TEST(MimeTypes, CaseInsensitive) {
    EXPECT_EQ(mime_type_for("PHOTO.PNG"), "image/png");
    EXPECT_EQ(mime_type_for("Notes.TxT"), "text/plain");
}

TEST(MimeTypes, FallsBackToOctetStream) {
    EXPECT_EQ(mime_type_for("data.unknownext"), "application/octet-stream");
    EXPECT_EQ(mime_type_for("Makefile"), "application/octet-stream");
    EXPECT_EQ(mime_type_for(".bashrc"), "application/octet-stream");
}
