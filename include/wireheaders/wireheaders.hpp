/*
 * Copyright (c) 2025 The wireheaders authors
 * 
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef WIRE_HEADERS_WIREHEADERS_HPP
#define WIRE_HEADERS_WIREHEADERS_HPP

#include "wireheaders/Results.hpp"
#include "wireheaders/Buffer.hpp"
#include "wireheaders/Timestamp.hpp"
#include "wireheaders/Logs.hpp"
#include "wireheaders/KnownHeaders.hpp"
#include "wireheaders/HeaderReader.hpp"
#include "wireheaders/HeaderValue.hpp"
#include "wireheaders/HeaderParsers.hpp"
#include "wireheaders/HeaderStore.hpp"
#include "wireheaders/HeaderValueCollection.hpp"
#include "wireheaders/CookieParser.hpp"
#include "wireheaders/Headers.hpp"
#include "wireheaders/Decompress.hpp"

#endif // WIRE_HEADERS_WIREHEADERS_HPP
