#pragma once

#include <stdexcept>
#include <string>

/**
 * Kinds of failure seen at the boundary with the external services.
 */
enum class ClusterErrorKind
{
    /* no response reached us - dependent data is unavailable, not empty */
    Connection,

    /* request exceeded its bounded timeout */
    Timeout,

    /* non-2xx (5xx) response, with the server's detail message */
    Server,

    /* invalid request, e.g. unknown file/node id (4xx) */
    Client,

    /* one of several parallel fetches failed while others succeeded */
    PartialData
};

/**
 * Error raised by the cluster service client.
 * 
 * what() carries the message to show the operator verbatim.
 */
class ClusterError : public std::runtime_error
{
public:
    ClusterError(ClusterErrorKind kind, const std::string &message, int statusCode = 0);

    ClusterErrorKind kind() const { return errorKind; }

    /* HTTP status code, 0 if no response was received */
    int statusCode() const { return httpStatus; }

private:
    ClusterErrorKind errorKind;
    int httpStatus;
};

/**
 * Returns the short name of the given kind, e.g. "connection".
 */
std::string toString(ClusterErrorKind kind);
