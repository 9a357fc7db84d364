// breeze umbrella header
//
// Include this single header to pull in the public API of the engine:
//   - Application, route bindings and the route table
//   - Resource, the base class of request handlers
//   - Request / response primitives and the connection interface
//
// Usage Example:
//    #include <breeze/breeze.hpp>
//
//    class HelloResource : public breeze::Resource {
//     protected:
//      void handleGet() override {
//        write("hello wind!");
//        finish();
//      }
//    };
//
//    breeze::Application app({breeze::RouteBinding::Of<HelloResource>("/", {"get"})});
//    app.react(conn, request);  // conn implements breeze::IConnection

#pragma once

// Engine
#include "breeze/application.hpp"       // IWYU pragma: export
#include "breeze/resource-context.hpp"  // IWYU pragma: export
#include "breeze/resource.hpp"          // IWYU pragma: export
#include "breeze/route-binding.hpp"     // IWYU pragma: export
#include "breeze/route-table.hpp"       // IWYU pragma: export

// Configuration & errors
#include "breeze/app-config.hpp"  // IWYU pragma: export
#include "breeze/http-error.hpp"  // IWYU pragma: export

// HTTP primitives
#include "breeze/connection.hpp"           // IWYU pragma: export
#include "breeze/http-request.hpp"         // IWYU pragma: export
#include "breeze/http-response.hpp"        // IWYU pragma: export
#include "breeze/response-header-set.hpp"  // IWYU pragma: export
#include "breeze/write-buffer.hpp"         // IWYU pragma: export

// HTTP protocol enums & helpers
#include "breeze/http-constants.hpp"    // IWYU pragma: export
#include "breeze/http-method.hpp"       // IWYU pragma: export
#include "breeze/http-status-code.hpp"  // IWYU pragma: export
#include "breeze/http-version.hpp"      // IWYU pragma: export
#include "breeze/version.hpp"           // IWYU pragma: export
