/*
 * Copyright (C) 2026  T+A elektroakustik GmbH & Co. KG
 *
 * This file is part of COVERPLAYD.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA  02110-1301, USA.
 */

#if HAVE_CONFIG_H
#include <config.h>
#endif /* HAVE_CONFIG_H */

#include <doctest.h>

#include <fstream>

#include <glib.h>
#include <glib/gstdio.h>
#include <nlohmann/json.hpp>

#include "catalog.hh"

TEST_SUITE_BEGIN("Catalog");

static const char CATALOG_JSON[] =
    "{\"items\": ["
    "{\"id\": \"a1\", \"uri\": \"spotify:album:a1\", \"name\": \"First Album\","
    " \"artist\": \"Someone\", \"image\": \"a1.jpg\"},"
    "{\"id\": \"t1\", \"uri\": \"spotify:track:t1\", \"name\": \"A Track\", \"type\": \"track\"},"
    "{\"id\": \"p1\", \"uri\": \"spotify:playlist:p1\", \"name\": \"Mix\"},"
    "{\"id\": \"x\", \"name\": \"No URI\"},"
    "{\"id\": \"p2\", \"uri\": \"spotify:album:p2\", \"name\": \"Typed\", \"type\": \"playlist\"}"
    "]}";

static Playback::Snapshot make_snapshot(const char *context_uri)
{
    Playback::Snapshot s;
    s.stopped_ = false;
    s.context_uri_ = context_uri;
    s.album_ = "Foreign Album";
    s.artist_ = "Foreign Artist";
    s.cover_url_ = "http://cover";
    return s;
}

TEST_CASE("Catalog is loaded from JSON")
{
    Catalog::List catalog;

    REQUIRE(catalog.load_from_string(CATALOG_JSON));
    REQUIRE(catalog.size() == 3);

    CHECK(catalog.at(0)->uri_ == "spotify:album:a1");
    CHECK(catalog.at(0)->name_ == "First Album");
    CHECK(catalog.at(0)->artist_ == "Someone");
    CHECK(catalog.at(0)->image_ == "a1.jpg");
    CHECK(catalog.at(0)->kind_ == Catalog::Kind::ALBUM);
    CHECK(catalog.at(1)->kind_ == Catalog::Kind::PLAYLIST);
    CHECK(catalog.at(2)->kind_ == Catalog::Kind::PLAYLIST);
    CHECK_FALSE(catalog.at(0)->is_temp_);
    CHECK(catalog.at(3) == nullptr);

    CHECK(catalog.find("spotify:playlist:p1") == 1);
    CHECK(catalog.find("spotify:track:t1") == -1);
    CHECK(catalog.find("") == -1);
}

TEST_CASE("Invalid catalog leaves list empty")
{
    Catalog::List catalog;

    CHECK_FALSE(catalog.load_from_string("{\"items\": [}"));
    CHECK(catalog.empty());

    CHECK(catalog.load_from_string("{\"something\": 1}"));
    CHECK(catalog.empty());
}

TEST_CASE("Missing catalog file leaves list empty")
{
    Catalog::List catalog;

    CHECK_FALSE(catalog.load("/nonexistent/coverplayd/catalog.json"));
    CHECK(catalog.empty());
}

TEST_CASE("Unknown playing context becomes temporary item")
{
    Catalog::List catalog;
    REQUIRE(catalog.load_from_string(CATALOG_JSON));

    CHECK(catalog.update_temp_item(make_snapshot("spotify:playlist:foreign")));
    REQUIRE(catalog.size() == 4);

    const Catalog::Item *temp = catalog.at(3);
    REQUIRE(temp != nullptr);
    CHECK(temp->is_temp_);
    CHECK(temp->uri_ == "spotify:playlist:foreign");
    CHECK(temp->name_ == "Foreign Album");
    CHECK(temp->kind_ == Catalog::Kind::PLAYLIST);
    CHECK(catalog.get_temp_item() == temp);
    CHECK(catalog.find("spotify:playlist:foreign") == 3);

    CHECK_FALSE(catalog.update_temp_item(make_snapshot("spotify:playlist:foreign")));
}

TEST_CASE("Temporary item goes away when context is known or cleared")
{
    Catalog::List catalog;
    REQUIRE(catalog.load_from_string(CATALOG_JSON));

    catalog.update_temp_item(make_snapshot("spotify:album:foreign"));
    REQUIRE(catalog.size() == 4);

    CHECK(catalog.update_temp_item(make_snapshot("spotify:album:a1")));
    CHECK(catalog.size() == 3);
    CHECK(catalog.get_temp_item() == nullptr);

    catalog.update_temp_item(make_snapshot("spotify:album:foreign"));
    CHECK(catalog.update_temp_item(Playback::Snapshot()));
    CHECK(catalog.size() == 3);

    CHECK_FALSE(catalog.update_temp_item(Playback::Snapshot()));
}

TEST_CASE("Temporary item without album name gets generic name")
{
    Catalog::List catalog;
    Playback::Snapshot s(make_snapshot("spotify:album:z"));
    s.album_.clear();

    CHECK(catalog.update_temp_item(s));
    REQUIRE(catalog.at(0) != nullptr);
    CHECK(catalog.at(0)->name_ == "Album");
}

class CatalogFileTestsFixture
{
  protected:
    std::string dir_name_;
    std::string file_name_;
    Catalog::List catalog_;

  public:
    explicit CatalogFileTestsFixture()
    {
        gchar *dir = g_dir_make_tmp("coverplayd-test-XXXXXX", nullptr);
        REQUIRE(dir != nullptr);
        dir_name_ = dir;
        file_name_ = dir_name_ + "/catalog.json";
        g_free(dir);

        std::ofstream out(file_name_);
        out << "{\"version\": 7, \"items\": ["
               "{\"id\": \"a1\", \"uri\": \"spotify:album:a1\", \"name\": \"First\","
               " \"currentTrack\": {\"uri\": \"spotify:track:x\"}},"
               "{\"id\": \"a2\", \"uri\": \"spotify:album:a2\", \"name\": \"Second\"},"
               "{\"id\": \"a3\", \"uri\": \"spotify:album:a3\", \"name\": \"Third\"}"
               "]}";
        out.close();
        REQUIRE(out.good());

        REQUIRE(catalog_.load(file_name_));
    }

    ~CatalogFileTestsFixture()
    {
        g_unlink(file_name_.c_str());
        g_rmdir(dir_name_.c_str());
    }

    nlohmann::json read_file() const
    {
        std::ifstream in(file_name_);
        return nlohmann::json::parse(in);
    }
};

TEST_CASE_FIXTURE(CatalogFileTestsFixture, "Temporary item is saved permanently")
{
    REQUIRE(catalog_.update_temp_item(make_snapshot("spotify:playlist:foreign")));
    REQUIRE(catalog_.size() == 4);

    CHECK(catalog_.save_temp_item());

    CHECK(catalog_.get_temp_item() == nullptr);
    REQUIRE(catalog_.size() == 4);
    CHECK_FALSE(catalog_.at(3)->is_temp_);
    CHECK(catalog_.at(3)->uri_ == "spotify:playlist:foreign");
    CHECK(catalog_.at(3)->name_ == "Foreign Album");
    CHECK(catalog_.at(3)->kind_ == Catalog::Kind::PLAYLIST);
    CHECK_FALSE(catalog_.at(3)->id_.empty());

    const auto data(read_file());
    CHECK(data["version"] == 7);
    REQUIRE(data["items"].size() == 4);
    CHECK(data["items"][0]["currentTrack"]["uri"] == "spotify:track:x");
    CHECK(data["items"][3]["uri"] == "spotify:playlist:foreign");
    CHECK(data["items"][3]["type"] == "playlist");
    CHECK(data["items"][3]["artist"] == "Foreign Artist");
    CHECK(data["items"][3]["image"] == "http://cover");

    Catalog::List reloaded;
    REQUIRE(reloaded.load(file_name_));
    CHECK(reloaded.size() == 4);
}

TEST_CASE_FIXTURE(CatalogFileTestsFixture, "Nothing is saved without temporary item")
{
    CHECK_FALSE(catalog_.save_temp_item());
    CHECK(read_file()["items"].size() == 3);
}

TEST_CASE_FIXTURE(CatalogFileTestsFixture, "Context already in catalog file is not saved twice")
{
    REQUIRE(catalog_.update_temp_item(make_snapshot("spotify:album:late")));

    /* someone else has added the same context in the meantime */
    auto data(read_file());
    data["items"].push_back({{"id", "x"}, {"uri", "spotify:album:late"}, {"name", "Late"}});
    std::ofstream out(file_name_);
    out << data.dump();
    out.close();

    CHECK_FALSE(catalog_.save_temp_item());
    CHECK(read_file()["items"].size() == 4);
}

TEST_CASE_FIXTURE(CatalogFileTestsFixture, "Catalog item is deleted")
{
    CHECK(catalog_.delete_item(1));

    REQUIRE(catalog_.size() == 2);
    CHECK(catalog_.at(0)->uri_ == "spotify:album:a1");
    CHECK(catalog_.at(1)->uri_ == "spotify:album:a3");

    const auto data(read_file());
    CHECK(data["version"] == 7);
    REQUIRE(data["items"].size() == 2);
    CHECK(data["items"][0]["currentTrack"]["uri"] == "spotify:track:x");
    CHECK(data["items"][1]["id"] == "a3");
}

TEST_CASE_FIXTURE(CatalogFileTestsFixture, "Temporary item cannot be deleted")
{
    REQUIRE(catalog_.update_temp_item(make_snapshot("spotify:album:foreign")));
    REQUIRE(catalog_.size() == 4);

    CHECK_FALSE(catalog_.delete_item(3));
    CHECK(catalog_.size() == 4);
    CHECK(read_file()["items"].size() == 3);
}

TEST_CASE("Catalog without file cannot be edited")
{
    Catalog::List catalog;
    REQUIRE(catalog.load_from_string(CATALOG_JSON));

    CHECK_FALSE(catalog.delete_item(0));
    CHECK(catalog.size() == 3);
}

TEST_SUITE_END();
