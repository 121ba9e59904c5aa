/**
 * Resumable Upload Client Example
 *
 * This example demonstrates how to:
 * 1. Open a staging upload
 * 2. Send a local file in chunks, resuming from the size the server reports
 * 3. Promote the upload into a resident file
 * 4. Fetch a byte range of the promoted file
 */

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTTPClientSession.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/HTTPResponse.h>
#include <Poco/Path.h>
#include <Poco/StreamCopier.h>
#include <Poco/URI.h>

using namespace Poco::Net;
using namespace Poco::JSON;
using namespace std;

class HarborClient {
private:
    HTTPClientSession session;

    /**
     * Send one request and collect the response body.
     */
    HTTPResponse::HTTPStatus send(HTTPRequest& request, const string& body, string& response_body) {
        request.setContentLength(static_cast<std::streamsize>(body.size()));
        ostream& request_stream = session.sendRequest(request);
        request_stream << body;

        HTTPResponse response;
        istream& response_stream = session.receiveResponse(response);
        stringstream collected;
        Poco::StreamCopier::copyStream(response_stream, collected);
        response_body = collected.str();
        return response.getStatus();
    }

    static Object::Ptr parse(const string& body) {
        Parser parser;
        return parser.parse(body).extract<Object::Ptr>();
    }

public:
    explicit HarborClient(const string& url) {
        Poco::URI uri(url);
        session.setHost(uri.getHost());
        session.setPort(uri.getPort());
        session.setKeepAlive(true);
    }

    /**
     * Open a staging upload and return its id, or an empty string on failure.
     */
    string createUpload(const string& name) {
        HTTPRequest request(HTTPRequest::HTTP_POST, "/v1/staging-files", HTTPMessage::HTTP_1_1);
        request.setContentType("application/json");

        Object::Ptr payload = new Object;
        payload->set("name", name);
        stringstream json_stream;
        payload->stringify(json_stream);

        string body;
        if (send(request, json_stream.str(), body) != HTTPResponse::HTTP_CREATED) {
            cout << "✗ Create failed: " << body << endl;
            return "";
        }
        return parse(body)->getValue<string>("id");
    }

    /**
     * Ask the server how many bytes it already holds for `id`.
     */
    bool stagedSize(const string& id, Poco::UInt64& size) {
        HTTPRequest request(HTTPRequest::HTTP_GET, "/v1/staging-files/" + id,
                            HTTPMessage::HTTP_1_1);
        string body;
        if (send(request, "", body) != HTTPResponse::HTTP_OK) {
            cout << "✗ Status failed: " << body << endl;
            return false;
        }
        size = parse(body)->getValue<Poco::UInt64>("size");
        return true;
    }

    /**
     * Upload `local_path`, starting at whatever the server already has.
     */
    bool uploadFile(const string& id, const string& local_path, size_t chunk_size) {
        ifstream file(local_path, ios::binary);
        if (!file.is_open()) {
            cout << "✗ Cannot open file: " << local_path << endl;
            return false;
        }
        file.seekg(0, ios::end);
        const Poco::UInt64 total = static_cast<Poco::UInt64>(file.tellg());

        Poco::UInt64 offset = 0;
        if (!stagedSize(id, offset)) {
            return false;
        }
        if (offset > 0) {
            cout << "↻ Resuming at byte " << offset << endl;
        }

        vector<char> buffer(chunk_size);
        while (offset < total) {
            const auto want = static_cast<size_t>(min<Poco::UInt64>(chunk_size, total - offset));
            file.seekg(static_cast<streamoff>(offset));
            file.read(buffer.data(), static_cast<streamsize>(want));

            HTTPRequest request(HTTPRequest::HTTP_PUT,
                                "/v1/staging-files/" + id + "?offset=" + to_string(offset),
                                HTTPMessage::HTTP_1_1);
            request.setContentType("application/octet-stream");
            string body;
            const auto status = send(request, string(buffer.data(), want), body);
            if (status != HTTPResponse::HTTP_OK) {
                cout << "✗ Chunk at " << offset << " failed (" << status << "): " << body << endl;
                return false;
            }
            offset = parse(body)->getValue<Poco::UInt64>("size");
            cout << "  " << offset << "/" << total << " bytes staged" << endl;
        }
        return true;
    }

    bool promote(const string& id) {
        HTTPRequest request(HTTPRequest::HTTP_POST, "/v1/staging-files/" + id + "/promote",
                            HTTPMessage::HTTP_1_1);
        string body;
        if (send(request, "", body) != HTTPResponse::HTTP_CREATED) {
            cout << "✗ Promote failed: " << body << endl;
            return false;
        }
        auto file = parse(body);
        cout << "✓ Promoted " << file->getValue<string>("name") << " ("
             << file->getValue<string>("mime") << ", sha256 " << file->getValue<string>("hash")
             << ")" << endl;
        return true;
    }

    /**
     * Print the first `length` bytes of the promoted file.
     */
    void printHead(const string& id, size_t length) {
        HTTPRequest request(HTTPRequest::HTTP_GET, "/v1/files/" + id + "/content",
                            HTTPMessage::HTTP_1_1);
        request.set("Range", "bytes=0-" + to_string(length - 1));
        string body;
        const auto status = send(request, "", body);
        if (status != HTTPResponse::HTTP_PARTIAL_CONTENT && status != HTTPResponse::HTTP_OK) {
            cout << "✗ Range read failed (" << status << ")" << endl;
            return;
        }
        cout << "First " << body.size() << " bytes:" << endl << body << endl;
    }
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cout << "usage: resumable_upload_client <file> [server_url] [staging_id]" << endl;
        return 1;
    }
    const string local_path = argv[1];
    const string server_url = argc > 2 ? argv[2] : "http://127.0.0.1:8080";

    try {
        HarborClient client(server_url);

        // Pass an existing staging id to resume an interrupted upload.
        string id = argc > 3 ? argv[3] : client.createUpload(Poco::Path(local_path).getFileName());
        if (id.empty()) {
            return 1;
        }
        cout << "Staging id: " << id << endl;

        if (!client.uploadFile(id, local_path, 64 * 1024) || !client.promote(id)) {
            return 1;
        }
        client.printHead(id, 64);
    } catch (const exception& e) {
        cout << "✗ Client error: " << e.what() << endl;
        return 1;
    }
    return 0;
}
