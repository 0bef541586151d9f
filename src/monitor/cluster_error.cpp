#include "cluster_error.hpp"

ClusterError::ClusterError(ClusterErrorKind kind, const std::string &message, int statusCode)
    : std::runtime_error(message),
      errorKind(kind),
      httpStatus(statusCode)
{
}

std::string toString(ClusterErrorKind kind)
{
    switch (kind)
    {
        case ClusterErrorKind::Connection:  return "connection";
        case ClusterErrorKind::Timeout:     return "timeout";
        case ClusterErrorKind::Server:      return "server";
        case ClusterErrorKind::Client:      return "client";
        case ClusterErrorKind::PartialData: return "partial-data";
    }
    return "unknown";
}
