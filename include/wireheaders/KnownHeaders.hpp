#ifndef WIRE_HEADERS_KNOWN_HEADERS_HPP
#define WIRE_HEADERS_KNOWN_HEADERS_HPP

#include <cstddef>
#include <string>

namespace wireheaders {

  // Canonical spelling of the header names the reader interns. Every lookup
  // hit returns the address of one of these constants, so two names that
  // resolve to the same known header share storage and can be compared by
  // address.
  namespace KnownHeaders {

    extern const std::string Accept;
    extern const std::string AcceptCharset;
    extern const std::string AcceptEncoding;
    extern const std::string AcceptLanguage;
    extern const std::string AcceptPatch;
    extern const std::string AcceptRanges;
    extern const std::string AccessControlAllowCredentials;
    extern const std::string AccessControlAllowHeaders;
    extern const std::string AccessControlAllowMethods;
    extern const std::string AccessControlAllowOrigin;
    extern const std::string AccessControlExposeHeaders;
    extern const std::string AccessControlMaxAge;
    extern const std::string Age;
    extern const std::string Allow;
    extern const std::string AltSvc;
    extern const std::string Authorization;
    extern const std::string CacheControl;
    extern const std::string Connection;
    extern const std::string ContentDisposition;
    extern const std::string ContentEncoding;
    extern const std::string ContentLanguage;
    extern const std::string ContentLength;
    extern const std::string ContentLocation;
    extern const std::string ContentMD5;
    extern const std::string ContentRange;
    extern const std::string ContentSecurityPolicy;
    extern const std::string ContentType;
    extern const std::string Cookie;
    extern const std::string Date;
    extern const std::string ETag;
    extern const std::string Expect;
    extern const std::string Expires;
    extern const std::string From;
    extern const std::string Host;
    extern const std::string IfMatch;
    extern const std::string IfModifiedSince;
    extern const std::string IfNoneMatch;
    extern const std::string IfRange;
    extern const std::string IfUnmodifiedSince;
    extern const std::string KeepAlive;
    extern const std::string LastModified;
    extern const std::string Link;
    extern const std::string Location;
    extern const std::string MaxForwards;
    extern const std::string Origin;
    extern const std::string P3P;
    extern const std::string Pragma;
    extern const std::string ProxyAuthenticate;
    extern const std::string ProxyAuthorization;
    extern const std::string ProxyConnection;
    extern const std::string PublicKeyPins;
    extern const std::string Range;
    extern const std::string Referer;
    extern const std::string RetryAfter;
    extern const std::string Server;
    extern const std::string SetCookie;
    extern const std::string SetCookie2;
    extern const std::string StrictTransportSecurity;
    extern const std::string TE;
    extern const std::string Trailer;
    extern const std::string TransferEncoding;
    extern const std::string Upgrade;
    extern const std::string UserAgent;
    extern const std::string Vary;
    extern const std::string Via;
    extern const std::string WWWAuthenticate;
    extern const std::string Warning;
    extern const std::string XAspNetVersion;
    extern const std::string XContentDuration;
    extern const std::string XContentTypeOptions;
    extern const std::string XFrameOptions;
    extern const std::string XMSEdgeRef;
    extern const std::string XPoweredBy;
    extern const std::string XRequestID;
    extern const std::string XUACompatible;
    extern const std::string XXSSProtection;

    // Case-insensitive lookup of buffer[start, start + length). Returns the
    // canonical constant, or nullptr when the name is not a known header.
    const std::string* find(const char* buffer, const size_t& start, const size_t& length);

    inline const std::string* find(const std::string& name) {
      return find(name.data(), 0, name.size());
    }

    bool tryGetHeaderName(const char* buffer, const size_t& start, const size_t& length, const std::string*& name);

  } // namespace KnownHeaders

} // namespace wireheaders

#endif // WIRE_HEADERS_KNOWN_HEADERS_HPP
