#include "geofix/geos_engine.hpp"

#define GEOS_USE_ONLY_R_API
#include <geos_c.h>

#include <string>

namespace geofix {

    namespace {
        struct ContextDeleter {
            void operator()(GEOSContextHandle_HS *ctx) const {
                if (ctx)
                    GEOS_finish_r(ctx);
            }
        };
        using ContextPtr = std::unique_ptr<GEOSContextHandle_HS, ContextDeleter>;

        class GeosGeometry : public Geometry {
          public:
            GeosGeometry(GEOSContextHandle_t ctx, GEOSGeometry *geom) : ctx_(ctx), geom_(geom) {}
            ~GeosGeometry() override { GEOSGeom_destroy_r(ctx_, geom_); }

            GeosGeometry(const GeosGeometry &) = delete;
            GeosGeometry &operator=(const GeosGeometry &) = delete;

            const GEOSGeometry *get() const { return geom_; }

          private:
            GEOSContextHandle_t ctx_;
            GEOSGeometry *geom_;
        };

        const GEOSGeometry *unwrap(const Geometry &geometry) {
            auto *g = dynamic_cast<const GeosGeometry *>(&geometry);
            if (!g)
                throw GeometryError("geofix::GeosEngine: geometry was not created by a GEOS engine");
            return g->get();
        }
    } // namespace

    struct GeosEngine::Impl {
        ContextPtr ctx;
        GEOSGeoJSONReader *reader = nullptr;
        GEOSGeoJSONWriter *writer = nullptr;
        Options opts;
        std::string last_error;

        static void onError(const char *message, void *userdata) {
            auto *self = static_cast<Impl *>(userdata);
            self->last_error = message ? message : "";
        }

        static void onNotice(const char *, void *) {}

        explicit Impl(Options o) : ctx(GEOS_init_r()), opts(o) {
            if (!ctx)
                throw std::runtime_error("geofix::GeosEngine: failed to initialize GEOS context");
            GEOSContext_setErrorMessageHandler_r(ctx.get(), &Impl::onError, this);
            GEOSContext_setNoticeMessageHandler_r(ctx.get(), &Impl::onNotice, this);

            reader = GEOSGeoJSONReader_create_r(ctx.get());
            writer = GEOSGeoJSONWriter_create_r(ctx.get());
            if (!reader || !writer) {
                release();
                throw std::runtime_error("geofix::GeosEngine: failed to create GEOS GeoJSON reader/writer");
            }
        }

        ~Impl() { release(); }

        void release() {
            if (writer)
                GEOSGeoJSONWriter_destroy_r(ctx.get(), writer);
            if (reader)
                GEOSGeoJSONReader_destroy_r(ctx.get(), reader);
            writer = nullptr;
            reader = nullptr;
        }

        // Message for the most recent GEOS failure, cleared once read.
        std::string takeError(const char *fallback) {
            std::string msg = last_error.empty() ? fallback : last_error;
            last_error.clear();
            return msg;
        }
    };

    GeosEngine::GeosEngine() : GeosEngine(Options{}) {}

    GeosEngine::GeosEngine(Options opts) : impl_(std::make_unique<Impl>(opts)) {}

    GeosEngine::~GeosEngine() = default;

    GeometryPtr GeosEngine::parse(const boost::json::object &geometry) const {
        std::string text = boost::json::serialize(geometry);
        GEOSGeometry *g = GEOSGeoJSONReader_readGeometry_r(impl_->ctx.get(), impl_->reader, text.c_str());
        if (!g)
            throw GeometryError("geofix::GeosEngine::parse(): " + impl_->takeError("cannot read geometry"));
        return std::make_unique<GeosGeometry>(impl_->ctx.get(), g);
    }

    bool GeosEngine::is_valid(const Geometry &geometry) const {
        char rc = GEOSisValid_r(impl_->ctx.get(), unwrap(geometry));
        if (rc == 2)
            throw GeometryError("geofix::GeosEngine::is_valid(): " + impl_->takeError("validity check failed"));
        return rc == 1;
    }

    bool GeosEngine::is_empty(const Geometry &geometry) const {
        char rc = GEOSisEmpty_r(impl_->ctx.get(), unwrap(geometry));
        if (rc == 2)
            throw GeometryError("geofix::GeosEngine::is_empty(): " + impl_->takeError("emptiness check failed"));
        return rc == 1;
    }

    GeometryPtr GeosEngine::buffer_zero(const Geometry &geometry) const {
        GEOSGeometry *g = GEOSBuffer_r(impl_->ctx.get(), unwrap(geometry), 0.0, impl_->opts.quadrant_segments);
        if (!g)
            throw GeometryError("geofix::GeosEngine::buffer_zero(): " + impl_->takeError("buffer failed"));
        return std::make_unique<GeosGeometry>(impl_->ctx.get(), g);
    }

    boost::json::object GeosEngine::to_geojson(const Geometry &geometry) const {
        auto *ctx = impl_->ctx.get();
        char *raw = GEOSGeoJSONWriter_writeGeometry_r(ctx, impl_->writer, unwrap(geometry), -1);
        if (!raw)
            throw GeometryError("geofix::GeosEngine::to_geojson(): " + impl_->takeError("cannot write geometry"));

        auto freeText = [ctx](char *p) { GEOSFree_r(ctx, p); };
        std::unique_ptr<char, decltype(freeText)> text(raw, freeText);

        boost::json::value v = boost::json::parse(text.get());
        if (!v.is_object())
            throw GeometryError("geofix::GeosEngine::to_geojson(): GEOS produced a non-object geometry");
        return std::move(v.as_object());
    }

} // namespace geofix
