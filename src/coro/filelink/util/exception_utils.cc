#include "coro/filelink/util/exception_utils.h"

#include <sstream>

#include "coro/exception.h"
#include "coro/http/http_exception.h"

namespace coro::filelink::util {

ErrorMetadata GetErrorMetadata(const std::exception_ptr& exception) {
  try {
    std::rethrow_exception(exception);
  } catch (const http::HttpException& e) {
    return ErrorMetadata{
        .status = e.status(),
        .what = e.what(),
        .source_location = e.source_location(),
        .stacktrace = e.stacktrace().empty()
                          ? std::nullopt
                          : std::make_optional(e.stacktrace())};
  } catch (const Exception& e) {
    return ErrorMetadata{
        .what = e.what(),
        .source_location = e.source_location(),
        .stacktrace = e.stacktrace().empty()
                          ? std::nullopt
                          : std::make_optional(e.stacktrace())};
  } catch (const std::exception& e) {
    return ErrorMetadata{.what = e.what()};
  } catch (...) {
    return ErrorMetadata{.what = "unknown exception"};
  }
}

std::string ToString(const ErrorMetadata& error) {
  std::stringstream stream;
  if (error.status) {
    stream << "STATUS = " << *error.status << " ";
  }
  stream << "WHAT = " << error.what;
  if (error.source_location) {
    stream << " SOURCE LOCATION = " << coro::ToString(*error.source_location);
  }
  if (error.stacktrace) {
    stream << "\nSTACKTRACE = " << coro::ToString(*error.stacktrace);
  }
  return std::move(stream).str();
}

}  // namespace coro::filelink::util
