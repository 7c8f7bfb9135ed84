#include "wireheaders/KnownHeaders.hpp"
#include "wireheaders/Buffer.hpp"
#include <cstddef>
#include <string>

namespace wireheaders {

  namespace KnownHeaders {

    const std::string Accept = "Accept";
    const std::string AcceptCharset = "Accept-Charset";
    const std::string AcceptEncoding = "Accept-Encoding";
    const std::string AcceptLanguage = "Accept-Language";
    const std::string AcceptPatch = "Accept-Patch";
    const std::string AcceptRanges = "Accept-Ranges";
    const std::string AccessControlAllowCredentials = "Access-Control-Allow-Credentials";
    const std::string AccessControlAllowHeaders = "Access-Control-Allow-Headers";
    const std::string AccessControlAllowMethods = "Access-Control-Allow-Methods";
    const std::string AccessControlAllowOrigin = "Access-Control-Allow-Origin";
    const std::string AccessControlExposeHeaders = "Access-Control-Expose-Headers";
    const std::string AccessControlMaxAge = "Access-Control-Max-Age";
    const std::string Age = "Age";
    const std::string Allow = "Allow";
    const std::string AltSvc = "Alt-Svc";
    const std::string Authorization = "Authorization";
    const std::string CacheControl = "Cache-Control";
    const std::string Connection = "Connection";
    const std::string ContentDisposition = "Content-Disposition";
    const std::string ContentEncoding = "Content-Encoding";
    const std::string ContentLanguage = "Content-Language";
    const std::string ContentLength = "Content-Length";
    const std::string ContentLocation = "Content-Location";
    const std::string ContentMD5 = "Content-MD5";
    const std::string ContentRange = "Content-Range";
    const std::string ContentSecurityPolicy = "Content-Security-Policy";
    const std::string ContentType = "Content-Type";
    const std::string Cookie = "Cookie";
    const std::string Date = "Date";
    const std::string ETag = "ETag";
    const std::string Expect = "Expect";
    const std::string Expires = "Expires";
    const std::string From = "From";
    const std::string Host = "Host";
    const std::string IfMatch = "If-Match";
    const std::string IfModifiedSince = "If-Modified-Since";
    const std::string IfNoneMatch = "If-None-Match";
    const std::string IfRange = "If-Range";
    const std::string IfUnmodifiedSince = "If-Unmodified-Since";
    const std::string KeepAlive = "Keep-Alive";
    const std::string LastModified = "Last-Modified";
    const std::string Link = "Link";
    const std::string Location = "Location";
    const std::string MaxForwards = "Max-Forwards";
    const std::string Origin = "Origin";
    const std::string P3P = "P3P";
    const std::string Pragma = "Pragma";
    const std::string ProxyAuthenticate = "Proxy-Authenticate";
    const std::string ProxyAuthorization = "Proxy-Authorization";
    const std::string ProxyConnection = "Proxy-Connection";
    const std::string PublicKeyPins = "Public-Key-Pins";
    const std::string Range = "Range";
    const std::string Referer = "Referer";
    const std::string RetryAfter = "Retry-After";
    const std::string Server = "Server";
    const std::string SetCookie = "Set-Cookie";
    const std::string SetCookie2 = "Set-Cookie2";
    const std::string StrictTransportSecurity = "Strict-Transport-Security";
    const std::string TE = "TE";
    const std::string Trailer = "Trailer";
    const std::string TransferEncoding = "Transfer-Encoding";
    const std::string Upgrade = "Upgrade";
    const std::string UserAgent = "User-Agent";
    const std::string Vary = "Vary";
    const std::string Via = "Via";
    const std::string WWWAuthenticate = "WWW-Authenticate";
    const std::string Warning = "Warning";
    const std::string XAspNetVersion = "X-AspNet-Version";
    const std::string XContentDuration = "X-Content-Duration";
    const std::string XContentTypeOptions = "X-Content-Type-Options";
    const std::string XFrameOptions = "X-Frame-Options";
    const std::string XMSEdgeRef = "X-MSEdge-Ref";
    const std::string XPoweredBy = "X-Powered-By";
    const std::string XRequestID = "X-Request-ID";
    const std::string XUACompatible = "X-UA-Compatible";
    const std::string XXSSProtection = "X-XSS-Protection";

    static const std::string* const table_[] = {
      &Accept,
      &AcceptCharset,
      &AcceptEncoding,
      &AcceptLanguage,
      &AcceptPatch,
      &AcceptRanges,
      &AccessControlAllowCredentials,
      &AccessControlAllowHeaders,
      &AccessControlAllowMethods,
      &AccessControlAllowOrigin,
      &AccessControlExposeHeaders,
      &AccessControlMaxAge,
      &Age,
      &Allow,
      &AltSvc,
      &Authorization,
      &CacheControl,
      &Connection,
      &ContentDisposition,
      &ContentEncoding,
      &ContentLanguage,
      &ContentLength,
      &ContentLocation,
      &ContentMD5,
      &ContentRange,
      &ContentSecurityPolicy,
      &ContentType,
      &Cookie,
      &Date,
      &ETag,
      &Expect,
      &Expires,
      &From,
      &Host,
      &IfMatch,
      &IfModifiedSince,
      &IfNoneMatch,
      &IfRange,
      &IfUnmodifiedSince,
      &KeepAlive,
      &LastModified,
      &Link,
      &Location,
      &MaxForwards,
      &Origin,
      &P3P,
      &Pragma,
      &ProxyAuthenticate,
      &ProxyAuthorization,
      &ProxyConnection,
      &PublicKeyPins,
      &Range,
      &Referer,
      &RetryAfter,
      &Server,
      &SetCookie,
      &SetCookie2,
      &StrictTransportSecurity,
      &TE,
      &Trailer,
      &TransferEncoding,
      &Upgrade,
      &UserAgent,
      &Vary,
      &Via,
      &WWWAuthenticate,
      &Warning,
      &XAspNetVersion,
      &XContentDuration,
      &XContentTypeOptions,
      &XFrameOptions,
      &XMSEdgeRef,
      &XPoweredBy,
      &XRequestID,
      &XUACompatible,
      &XXSSProtection,
    };

    const std::string* find(const char* buffer, const size_t& start, const size_t& length) {
      if (buffer == nullptr || length == 0) return nullptr;

      for (const std::string* known : table_) {
        // Length check first, most names are rejected without touching the buffer.
        if (known->size() != length) continue;
        if (wireheaders::Buffer::equalsIgnoreCase(*known, buffer, start, length)) {
          return known;
        }
      }

      return nullptr;
    }

    bool tryGetHeaderName(const char* buffer, const size_t& start, const size_t& length, const std::string*& name) {
      name = find(buffer, start, length);
      return name != nullptr;
    }

  } // namespace KnownHeaders

} // namespace wireheaders
