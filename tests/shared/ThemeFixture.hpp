#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <helpers/memory/Memory.hpp>

#include <X11/Xcursor/Xcursor.h>

#include <gtest/gtest.h>

namespace Tests {
    struct SXImageDesc {
        uint32_t size   = 24;
        uint32_t width  = 24;
        uint32_t height = 24;
        uint32_t xhot   = 0;
        uint32_t yhot   = 0;
        uint32_t delay  = 0;
        uint32_t argb   = 0xFF000000; // every pixel
    };

    // a scratch directory for building theme trees, removed on destruction
    class CThemeFixture {
      public:
        CThemeFixture() {
            std::string tmpl = (std::filesystem::temp_directory_path() / "kcursor-test-XXXXXX").string();
            if (!mkdtemp(tmpl.data()))
                throw std::runtime_error("mkdtemp failed");
            m_base = tmpl;
        }

        ~CThemeFixture() {
            std::error_code ec;
            std::filesystem::remove_all(m_base, ec);
        }

        CThemeFixture(const CThemeFixture&) = delete;

        const std::filesystem::path& base() const {
            return m_base;
        }

        // creates (if needed) and returns base/rel
        std::filesystem::path dir(const std::filesystem::path& rel) const {
            const auto p = m_base / rel;
            std::filesystem::create_directories(p);
            return p;
        }

        static void writeFile(const std::filesystem::path& path, const std::string& content) {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream of(path, std::ios::trunc | std::ios::binary);
            of << content;
        }

        static void writeXCursor(const std::filesystem::path& path, const std::vector<SXImageDesc>& descs) {
            std::filesystem::create_directories(path.parent_path());

            XcursorImages* images = XcursorImagesCreate(sc<int>(descs.size()));
            ASSERT_NE(images, nullptr);

            for (const auto& desc : descs) {
                XcursorImage* img = XcursorImageCreate(sc<int>(desc.width), sc<int>(desc.height));
                ASSERT_NE(img, nullptr);

                img->size  = desc.size;
                img->xhot  = desc.xhot;
                img->yhot  = desc.yhot;
                img->delay = desc.delay;
                for (size_t i = 0; i < sc<size_t>(desc.width) * desc.height; ++i) {
                    img->pixels[i] = desc.argb;
                }

                images->images[images->nimage++] = img;
            }

            const bool OK = XcursorFilenameSaveImages(path.c_str(), images);
            XcursorImagesDestroy(images);

            ASSERT_TRUE(OK) << "failed writing " << path;
        }

        static std::string squareSvg(uint32_t w, uint32_t h, const std::string& fill = "#ff0000") {
            return std::format(R"#(<svg xmlns="http://www.w3.org/2000/svg" width="{0}" height="{1}" viewBox="0 0 {0} {1}"><rect x="0" y="0" width="{0}" height="{1}" fill="{2}"/></svg>)#",
                               w, h, fill);
        }

        // an svg cursor dir with one frame per svg, all authored at nominalSize
        static void writeSvgIcon(const std::filesystem::path& iconDir, const std::vector<std::string>& svgs, double nominalSize, double xhot = 0, double yhot = 0,
                                 uint32_t delay = 0) {
            std::string meta = "[";
            for (size_t i = 0; i < svgs.size(); ++i) {
                const auto NAME = std::format("frame-{}.svg", i);
                writeFile(iconDir / NAME, svgs[i]);

                meta += std::format(R"#({}{{"filename": "{}", "hotspot_x": {}, "hotspot_y": {}, "nominal_size": {}{}}})#", i == 0 ? "" : ", ", NAME, xhot, yhot, nominalSize,
                                    delay ? std::format(R"#(, "delay": {})#", delay) : "");
            }
            meta += "]";

            writeFile(iconDir / "metadata.json", meta);
        }

      private:
        std::filesystem::path m_base;
    };
}
