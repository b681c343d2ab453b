#pragma once

namespace CLI {
class App;
}

namespace chatport::cli {

// `chatport download-attachments`: fetch listed attachments into the content-addressed store
void registerDownloadAttachmentsCommand(CLI::App& app);

} // namespace chatport::cli
